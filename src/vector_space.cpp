#include "vector_space.hpp"
#include "errors.hpp"
#include <random>
#include <string>

namespace glove {

VectorSpace::VectorSpace(int vocab_size, int dimension, uint64_t seed) {
    if (vocab_size <= 0) {
        throw InvalidConfiguration("vocabulary size must be > 0, got " + std::to_string(vocab_size));
    }
    if (dimension <= 0) {
        throw InvalidConfiguration("dimension must be > 0, got " + std::to_string(dimension));
    }

    std::mt19937_64 rng(seed != 0 ? seed : std::random_device{}());

    // 每个分量独立服从 U(-0.5/D, 0.5/D)
    vectors_ = DenseMatrix(vocab_size, dimension);
    std::uniform_real_distribution<double> dist(-0.5 / dimension, 0.5 / dimension);
    for (auto& val : vectors_.Data()) {
        val = dist(rng);
    }

    biases_.assign(vocab_size, 0.0);
    vector_gradsq_ = DenseMatrix(vocab_size, dimension, kInitialGradSq);
    bias_gradsq_.assign(vocab_size, kInitialGradSq);
}

VectorSpace::VectorSpace(DenseMatrix vectors, std::vector<double> biases)
    : vectors_(std::move(vectors)), biases_(std::move(biases)) {
    if (vectors_.Rows() != biases_.size()) {
        throw DataIntegrityError("vector matrix has " + std::to_string(vectors_.Rows()) +
                                 " rows but bias vector has " + std::to_string(biases_.size()) +
                                 " entries");
    }
    vector_gradsq_ = DenseMatrix(vectors_.Rows(), vectors_.Cols(), kInitialGradSq);
    bias_gradsq_.assign(biases_.size(), kInitialGradSq);
}

} // namespace glove
