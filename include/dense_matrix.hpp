#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

namespace glove {

// 行主序的稠密矩阵，只提供训练和查询需要的操作
class DenseMatrix {
public:
    DenseMatrix() = default;
    DenseMatrix(size_t rows, size_t cols, double value = 0.0)
        : rows_(rows), cols_(cols), data_(rows * cols, value) {}

    size_t Rows() const { return rows_; }
    size_t Cols() const { return cols_; }

    double* Row(size_t row) { return data_.data() + row * cols_; }
    const double* Row(size_t row) const { return data_.data() + row * cols_; }

    double& At(size_t row, size_t col) { return data_[row * cols_ + col]; }
    double At(size_t row, size_t col) const { return data_[row * cols_ + col]; }

    std::vector<double>& Data() { return data_; }
    const std::vector<double>& Data() const { return data_; }

    bool operator==(const DenseMatrix& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_ && data_ == other.data_;
    }
    bool operator!=(const DenseMatrix& other) const { return !(*this == other); }

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<double> data_;
};

inline double Dot(const double* a, const double* b, size_t n) {
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

inline double Norm(const double* a, size_t n) {
    return std::sqrt(Dot(a, a, n));
}

} // namespace glove
