#pragma once

#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

namespace glove {

struct VocabWord {
    std::string word;
    long long count;

    VocabWord(const std::string& w = "", long long c = 0)
        : word(w), count(c) {}
};

// token -> (id, 出现次数)。id 连续、从 0 开始，构建后不再变化
class Vocabulary {
public:
    Vocabulary() = default;

    // 从已切分的词序列学习词汇表，丢弃词频 < min_count 的词
    void LearnFromTokens(const std::vector<std::string>& tokens, int min_count = 1);

    // 追加一个词（加载时使用），重复的词抛 std::invalid_argument
    int AddWord(const std::string& word, long long count);

    // 保存/加载：每行 "word count"
    void Save(std::ostream& out) const;
    void Load(std::istream& in, size_t size);

    // 查询
    int GetWordIndex(const std::string& word) const;
    bool Contains(const std::string& word) const { return GetWordIndex(word) != -1; }
    const VocabWord& GetWord(int index) const { return vocab_[index]; }
    size_t Size() const { return vocab_.size(); }
    long long TotalWords() const { return train_words_; }

private:
    std::vector<VocabWord> vocab_;
    std::unordered_map<std::string, int> word_to_index_;
    long long train_words_ = 0;

    void SortAndFilter(int min_count);
};

} // namespace glove
