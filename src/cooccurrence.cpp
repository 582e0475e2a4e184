#include "cooccurrence.hpp"
#include "thread_pool.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace glove {

CooccurrenceMatrix CooccurrenceBuilder::Build(const std::vector<TokenPair>& pairs,
                                              size_t vocab_size) const {
    const int num_threads = pool_.Size();
    const size_t chunk = (pairs.size() + num_threads - 1) / num_threads;

    std::vector<CooccurrenceMatrix> partials(num_threads, CooccurrenceMatrix(vocab_size));

    pool_.RunAndWait(num_threads, [&](int thread_id) {
        const size_t begin = std::min(pairs.size(), chunk * thread_id);
        const size_t end = std::min(pairs.size(), begin + chunk);
        CooccurrenceMatrix& partial = partials[thread_id];

        for (size_t k = begin; k < end; ++k) {
            const TokenPair& pair = pairs[k];
            if (pair.distance < 1) {
                throw std::invalid_argument("Token pair " + std::to_string(k) +
                                            " has distance " + std::to_string(pair.distance));
            }
            // 调和衰减：距离 d 的一次共现贡献 1/d，对称地加到两个单元
            const double weight = 1.0 / pair.distance;
            partial.Add(pair.first, pair.second, weight);
            partial.Add(pair.second, pair.first, weight);
        }
    });

    // 归约
    CooccurrenceMatrix result = std::move(partials[0]);
    for (int i = 1; i < num_threads; ++i) {
        result.Merge(partials[i]);
    }
    return result;
}

} // namespace glove
