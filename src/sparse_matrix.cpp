#include "sparse_matrix.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace glove {

CooccurrenceMatrix::CooccurrenceMatrix(size_t size) : rows_(size) {}

void CooccurrenceMatrix::CheckIndex(int row, int col) const {
    const int size = static_cast<int>(rows_.size());
    if (row < 0 || row >= size || col < 0 || col >= size) {
        throw std::out_of_range("Co-occurrence index (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") outside vocabulary of size " +
                                std::to_string(size));
    }
}

double CooccurrenceMatrix::Get(int row, int col) const {
    CheckIndex(row, col);
    const auto& cells = rows_[row];
    auto it = cells.find(col);
    return it != cells.end() ? it->second : 0.0;
}

void CooccurrenceMatrix::Add(int row, int col, double value) {
    CheckIndex(row, col);
    rows_[row][col] += value;
}

void CooccurrenceMatrix::Merge(const CooccurrenceMatrix& other) {
    if (other.Size() != Size()) {
        throw std::invalid_argument("Cannot merge co-occurrence matrices of size " +
                                    std::to_string(other.Size()) + " into " +
                                    std::to_string(Size()));
    }
    for (size_t row = 0; row < rows_.size(); ++row) {
        for (const auto& cell : other.rows_[row]) {
            rows_[row][cell.first] += cell.second;
        }
    }
}

std::vector<MatrixEntry> CooccurrenceMatrix::NonZeroEntries() const {
    std::vector<MatrixEntry> entries;
    entries.reserve(NonZeroCount());

    for (size_t row = 0; row < rows_.size(); ++row) {
        size_t row_begin = entries.size();
        for (const auto& cell : rows_[row]) {
            if (cell.second != 0.0) {
                entries.push_back({static_cast<int>(row), cell.first});
            }
        }
        // 哈希表的遍历顺序不稳定，行内按列排序保证顺序可复现
        std::sort(entries.begin() + row_begin, entries.end(),
                  [](const MatrixEntry& a, const MatrixEntry& b) { return a.col < b.col; });
    }
    return entries;
}

size_t CooccurrenceMatrix::NonZeroCount() const {
    size_t count = 0;
    for (const auto& cells : rows_) {
        for (const auto& cell : cells) {
            if (cell.second != 0.0) ++count;
        }
    }
    return count;
}

std::vector<double> CooccurrenceMatrix::ToDense() const {
    const size_t size = rows_.size();
    std::vector<double> cells(size * size, 0.0);
    for (size_t row = 0; row < size; ++row) {
        for (const auto& cell : rows_[row]) {
            cells[row * size + cell.first] = cell.second;
        }
    }
    return cells;
}

CooccurrenceMatrix CooccurrenceMatrix::FromDense(const std::vector<double>& cells, size_t size) {
    if (cells.size() != size * size) {
        throw std::invalid_argument("Dense payload has " + std::to_string(cells.size()) +
                                    " cells, expected " + std::to_string(size * size));
    }
    CooccurrenceMatrix matrix(size);
    for (size_t row = 0; row < size; ++row) {
        for (size_t col = 0; col < size; ++col) {
            double value = cells[row * size + col];
            if (value != 0.0) {
                matrix.rows_[row][static_cast<int>(col)] = value;
            }
        }
    }
    return matrix;
}

} // namespace glove
