#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "corpus.hpp"
#include "query.hpp"
#include "sparse_matrix.hpp"
#include "trainer.hpp"
#include "vector_space.hpp"

namespace glove {

class ThreadPool;

// 保存模型的四个文件，由同一个前缀派生
struct ModelFiles {
    std::string corpus;
    std::string cooc;
    std::string vectors;
    std::string biases;

    static ModelFiles FromPrefix(const std::string& prefix) {
        return {prefix + ".corpus", prefix + ".cooc", prefix + ".vec", prefix + ".bias"};
    }
};

class GloveModel {
public:
    struct Config {
        double max_count = 100;          // 加权函数截断点
        double learning_rate = 0.05;     // 初始学习率
        double alpha = 0.75;             // 加权函数指数
        int num_components = 30;         // 向量维度
        int epochs = 5;                  // 迭代次数
        int threads = 4;                 // 构建共现矩阵和训练使用的线程数，必须 > 0
        int window = 2;                  // 窗口大小
        int min_count = 1;               // 最小词频
        std::vector<std::string> stop_words;
        UpdateMode update_mode = UpdateMode::kLockFree;
        uint64_t seed = 0;               // 0 = 随机
        bool verbose = false;

        Config() = default;

        void Validate() const;
        Trainer::Config TrainerConfig() const;
        Corpus::Options CorpusOptions() const;
    };

    GloveModel();
    explicit GloveModel(const Config& config);
    ~GloveModel();

    // 构建语料、共现矩阵并随机初始化词向量
    GloveModel& Fit(const std::string& text);
    GloveModel& Fit(Corpus corpus);

    // 训练，必须先 Fit 或 Load
    GloveModel& Train();

    // 四个独立文件：语料、共现矩阵 (V*V double)、词向量 (V*D double)、偏置 (V double)
    void Save(const std::string& corpus_file, const std::string& cooc_file,
              const std::string& vec_file, const std::string& bias_file) const;
    void Load(const std::string& corpus_file, const std::string& cooc_file,
              const std::string& vec_file, const std::string& bias_file);
    void Save(const ModelFiles& files) const {
        Save(files.corpus, files.cooc, files.vectors, files.biases);
    }
    void Load(const ModelFiles& files) {
        Load(files.corpus, files.cooc, files.vectors, files.biases);
    }

    // word2vec 文本格式："V D" 头，之后每行 "word v1 ... vD"
    void SaveVectorsText(const std::string& filename) const;

    SimilarWords MostSimilar(const std::string& word, int num = 3) const;
    bool Contains(const std::string& word) const;
    SimilarWords AnalogyWords(const std::string& word1, const std::string& word2,
                              const std::string& target, int num = 3,
                              double accuracy = 0.0001) const;

    // 词向量图形化，未实现
    void Visualize() const;

    bool IsFitted() const { return space_ != nullptr; }
    const Config& config() const { return config_; }
    const Corpus& corpus() const { return corpus_; }
    const CooccurrenceMatrix& cooc_matrix() const { return cooc_matrix_; }
    const VectorSpace& vector_space() const;
    const Trainer& trainer() const { return *trainer_; }

private:
    Config config_;
    std::unique_ptr<ThreadPool> pool_;
    std::unique_ptr<Trainer> trainer_;

    Corpus corpus_;
    CooccurrenceMatrix cooc_matrix_;
    std::unique_ptr<VectorSpace> space_;
    std::unique_ptr<QueryEngine> query_;

    void RequireFitted(const char* operation) const;
};

} // namespace glove
