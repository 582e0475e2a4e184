#include "query.hpp"
#include "corpus.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace glove {

QueryEngine::QueryEngine(const Vocabulary& vocab, const VectorSpace& space)
    : vocab_(vocab), space_(space) {
    if (vocab_.Size() != space_.VocabSize()) {
        throw std::invalid_argument("Vocabulary has " + std::to_string(vocab_.Size()) +
                                    " words but vector space has " +
                                    std::to_string(space_.VocabSize()) + " rows");
    }
}

const double* QueryEngine::Vector(const std::string& word) const {
    int index = vocab_.GetWordIndex(Corpus::Normalize(word));
    return index == -1 ? nullptr : space_.Vector(index);
}

double QueryEngine::Cosine(const double* a, const double* b, size_t dim) {
    if (a == nullptr || b == nullptr) return 0.0;
    const double norms = Norm(a, dim) * Norm(b, dim);
    if (norms == 0.0) return 0.0;
    return Dot(a, b, dim) / norms;
}

double QueryEngine::Cosine(const std::string& word1, const std::string& word2) const {
    return Cosine(Vector(word1), Vector(word2), space_.Dimension());
}

SimilarWords QueryEngine::VectorDistance(const std::string& word) const {
    SimilarWords results;
    const int query_index = vocab_.GetWordIndex(Corpus::Normalize(word));
    if (query_index == -1) return results;

    const double* query = space_.Vector(query_index);
    const size_t dim = space_.Dimension();

    results.reserve(vocab_.Size() - 1);
    for (size_t i = 0; i < vocab_.Size(); ++i) {
        // 跳过查询词本身
        if (static_cast<int>(i) == query_index) continue;
        results.emplace_back(vocab_.GetWord(i).word,
                             Cosine(query, space_.Vector(i), dim));
    }

    // 同分时保持词汇表顺序
    std::stable_sort(results.begin(), results.end(),
                     [](const std::pair<std::string, double>& a,
                        const std::pair<std::string, double>& b) {
                         return a.second > b.second;
                     });
    return results;
}

SimilarWords QueryEngine::MostSimilar(const std::string& word, int num) const {
    SimilarWords results = VectorDistance(word);
    if (num >= 0 && results.size() > static_cast<size_t>(num)) {
        results.resize(num);
    }
    return results;
}

SimilarWords QueryEngine::AnalogyWords(const std::string& word1, const std::string& word2,
                                       const std::string& target, int num,
                                       double accuracy) const {
    const double baseline = Cosine(word1, word2);

    SimilarWords results;
    for (auto& candidate : VectorDistance(target)) {
        if (num >= 0 && results.size() >= static_cast<size_t>(num)) break;
        if (std::fabs(candidate.second - baseline) < accuracy) continue;
        results.push_back(std::move(candidate));
    }
    return results;
}

} // namespace glove
