#pragma once

#include <string>
#include <utility>
#include <vector>
#include "vector_space.hpp"
#include "vocabulary.hpp"

namespace glove {

// (词, 余弦相似度)，按相似度降序
using SimilarWords = std::vector<std::pair<std::string, double>>;

// 只读查询：最近邻和类比。未登录词不是错误，返回空结果
class QueryEngine {
public:
    QueryEngine(const Vocabulary& vocab, const VectorSpace& space);

    // 与 word 最相似的 num 个词，不含 word 本身
    SimilarWords MostSimilar(const std::string& word, int num = 3) const;

    // 归一化后的词是否在词汇表中
    bool Contains(const std::string& word) const { return Vector(word) != nullptr; }

    // 以 target 为中心按相似度排序，剔除与 cos(word1, word2) 相差小于 accuracy 的候选
    SimilarWords AnalogyWords(const std::string& word1, const std::string& word2,
                              const std::string& target, int num = 3,
                              double accuracy = 0.0001) const;

    // 词向量；未登录词返回 nullptr
    const double* Vector(const std::string& word) const;

    // dot(a, b) / (|a| |b|)；任一向量不存在或范数为 0 时返回 0
    static double Cosine(const double* a, const double* b, size_t dim);
    double Cosine(const std::string& word1, const std::string& word2) const;

private:
    const Vocabulary& vocab_;
    const VectorSpace& space_;

    // 词汇表中除 word 外所有词与 word 的余弦相似度，降序
    SimilarWords VectorDistance(const std::string& word) const;
};

} // namespace glove
