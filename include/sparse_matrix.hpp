#pragma once

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace glove {

// 共现矩阵的一个非零坐标
struct MatrixEntry {
    int row;
    int col;

    bool operator==(const MatrixEntry& other) const {
        return row == other.row && col == other.col;
    }
};

// 方阵形式的稀疏共现矩阵 (V x V)，每行一个哈希表，只存非零元素
class CooccurrenceMatrix {
public:
    CooccurrenceMatrix() = default;
    explicit CooccurrenceMatrix(size_t size);

    size_t Size() const { return rows_.size(); }

    // 读取 (row, col)，未存储的单元返回 0
    double Get(int row, int col) const;

    // (row, col) += value；越界抛 std::out_of_range
    void Add(int row, int col, double value);

    // 把另一个同尺寸矩阵逐元素累加进来（并行构建时的归约步骤）
    void Merge(const CooccurrenceMatrix& other);

    // 所有非零坐标，按 (row, col) 升序
    std::vector<MatrixEntry> NonZeroEntries() const;
    size_t NonZeroCount() const;

    // 按行主序展开成 V*V 个 double（持久化格式）
    std::vector<double> ToDense() const;
    static CooccurrenceMatrix FromDense(const std::vector<double>& cells, size_t size);

    bool operator==(const CooccurrenceMatrix& other) const { return rows_ == other.rows_; }
    bool operator!=(const CooccurrenceMatrix& other) const { return !(*this == other); }

private:
    std::vector<std::unordered_map<int, double>> rows_;

    void CheckIndex(int row, int col) const;
};

} // namespace glove
