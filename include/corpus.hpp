#pragma once

#include <string>
#include <unordered_set>
#include <vector>
#include "vocabulary.hpp"

namespace glove {

// 一次共现观测：两个词 id 以及它们在文本中的位置距离 (>= 1)
struct TokenPair {
    int first;
    int second;
    int distance;
};

// 词汇表 + 词对观测。由原始文本构建一次，之后只读
class Corpus {
public:
    struct Options {
        int window = 2;                          // 对称窗口大小
        int min_count = 1;                       // 最小词频
        std::vector<std::string> stop_words;     // 停用词，不进入词汇表

        Options() = default;
    };

    Corpus() = default;

    static Corpus Build(const std::string& text);
    static Corpus Build(const std::string& text, const Options& options);
    static Corpus BuildFromFile(const std::string& filename);
    static Corpus BuildFromFile(const std::string& filename, const Options& options);

    // 小写化、去掉非字母数字字符
    static std::string Normalize(const std::string& word);
    static std::vector<std::string> Tokenize(const std::string& text,
                                             const std::unordered_set<std::string>& stop_words);

    const Vocabulary& vocab() const { return vocab_; }
    const std::vector<TokenPair>& pairs() const { return pairs_; }
    size_t Size() const { return vocab_.Size(); }

    // 文本格式：头部、词汇表、词对
    void Save(const std::string& filename) const;
    static Corpus Load(const std::string& filename);

private:
    Vocabulary vocab_;
    std::vector<TokenPair> pairs_;
};

} // namespace glove
