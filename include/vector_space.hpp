#pragma once

#include <cstdint>
#include <vector>
#include "dense_matrix.hpp"

namespace glove {

// 训练的全部可变状态：词向量、偏置、AdaGrad 梯度平方累加器
class VectorSpace {
public:
    // AdaGrad 累加器初值，不能为 0（第一次更新要除以 sqrt）
    static constexpr double kInitialGradSq = 1.0;

    VectorSpace() = default;
    // seed == 0 时使用 std::random_device
    VectorSpace(int vocab_size, int dimension, uint64_t seed = 0);

    // 从已有参数重建（加载时使用），累加器重新初始化
    VectorSpace(DenseMatrix vectors, std::vector<double> biases);

    size_t VocabSize() const { return vectors_.Rows(); }
    size_t Dimension() const { return vectors_.Cols(); }

    double* Vector(int word) { return vectors_.Row(word); }
    const double* Vector(int word) const { return vectors_.Row(word); }
    double& Bias(int word) { return biases_[word]; }
    double Bias(int word) const { return biases_[word]; }

    double* VectorGradSq(int word) { return vector_gradsq_.Row(word); }
    double& BiasGradSq(int word) { return bias_gradsq_[word]; }

    const DenseMatrix& vectors() const { return vectors_; }
    const std::vector<double>& biases() const { return biases_; }
    const DenseMatrix& vector_gradsq() const { return vector_gradsq_; }
    const std::vector<double>& bias_gradsq() const { return bias_gradsq_; }

private:
    DenseMatrix vectors_;
    std::vector<double> biases_;
    DenseMatrix vector_gradsq_;
    std::vector<double> bias_gradsq_;
};

} // namespace glove
