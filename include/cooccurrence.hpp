#pragma once

#include <vector>
#include "corpus.hpp"
#include "sparse_matrix.hpp"

namespace glove {

class ThreadPool;

// 由词对观测构建对称、按距离调和衰减 (1/d) 的共现矩阵
class CooccurrenceBuilder {
public:
    explicit CooccurrenceBuilder(ThreadPool& pool) : pool_(pool) {}

    // 观测被切成 pool.Size() 段连续区间，每个线程累加到私有矩阵，
    // 全部结束后再归约，并行阶段没有共享写。
    // id 越界抛 std::out_of_range，distance < 1 抛 std::invalid_argument。
    CooccurrenceMatrix Build(const std::vector<TokenPair>& pairs, size_t vocab_size) const;

private:
    ThreadPool& pool_;
};

} // namespace glove
