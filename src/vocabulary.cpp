#include "vocabulary.hpp"
#include "errors.hpp"
#include <algorithm>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace glove {

void Vocabulary::LearnFromTokens(const std::vector<std::string>& tokens, int min_count) {
    vocab_.clear();
    word_to_index_.clear();
    train_words_ = 0;

    // 统计词频，新词按首次出现的顺序追加
    for (const auto& word : tokens) {
        if (word.empty()) continue;

        train_words_++;

        auto it = word_to_index_.find(word);
        if (it == word_to_index_.end()) {
            word_to_index_[word] = static_cast<int>(vocab_.size());
            vocab_.emplace_back(word, 1);
        } else {
            vocab_[it->second].count++;
        }
    }

    SortAndFilter(min_count);
}

void Vocabulary::SortAndFilter(int min_count) {
    // 按词频降序排序；stable_sort 让同频词保持首次出现的顺序
    std::stable_sort(vocab_.begin(), vocab_.end(),
                     [](const VocabWord& a, const VocabWord& b) {
                         return a.count > b.count;
                     });

    // 重建哈希表并过滤低频词
    word_to_index_.clear();
    std::vector<VocabWord> filtered_vocab;

    for (auto& word : vocab_) {
        if (word.count >= min_count) {
            word_to_index_[word.word] = static_cast<int>(filtered_vocab.size());
            filtered_vocab.push_back(std::move(word));
        }
    }

    vocab_ = std::move(filtered_vocab);

    // 重新计算总词数
    train_words_ = 0;
    for (const auto& word : vocab_) {
        train_words_ += word.count;
    }
}

int Vocabulary::AddWord(const std::string& word, long long count) {
    if (word_to_index_.count(word)) {
        throw std::invalid_argument("Duplicate vocabulary word: " + word);
    }
    int index = static_cast<int>(vocab_.size());
    word_to_index_[word] = index;
    vocab_.emplace_back(word, count);
    train_words_ += count;
    return index;
}

int Vocabulary::GetWordIndex(const std::string& word) const {
    auto it = word_to_index_.find(word);
    return it != word_to_index_.end() ? it->second : -1;
}

void Vocabulary::Save(std::ostream& out) const {
    for (const auto& word : vocab_) {
        out << word.word << " " << word.count << "\n";
    }
}

void Vocabulary::Load(std::istream& in, size_t size) {
    vocab_.clear();
    word_to_index_.clear();
    train_words_ = 0;

    std::string word;
    long long count = 0;
    for (size_t i = 0; i < size; ++i) {
        if (!(in >> word >> count)) {
            throw DataIntegrityError("vocabulary truncated after " + std::to_string(i) +
                                     " of " + std::to_string(size) + " words");
        }
        if (count <= 0 || word_to_index_.count(word)) {
            throw DataIntegrityError("bad vocabulary record for \"" + word + "\"");
        }
        AddWord(word, count);
    }
}

} // namespace glove
