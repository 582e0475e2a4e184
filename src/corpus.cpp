#include "corpus.hpp"
#include "errors.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace glove {

namespace {

const char* const kCorpusMagic = "glove-corpus";
constexpr int kCorpusVersion = 1;

// UTF-8 多字节字符的字节都 >= 0x80，当作词的一部分保留
bool IsWordChar(unsigned char c) {
    return c >= 0x80 || std::isalnum(c);
}

} // namespace

std::string Corpus::Normalize(const std::string& word) {
    std::string normalized;
    normalized.reserve(word.size());
    for (unsigned char c : word) {
        if (!IsWordChar(c)) continue;
        normalized += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
    }
    return normalized;
}

std::vector<std::string> Corpus::Tokenize(const std::string& text,
                                          const std::unordered_set<std::string>& stop_words) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (!current.empty() && !stop_words.count(current)) {
            tokens.push_back(current);
        }
        current.clear();
    };

    for (unsigned char c : text) {
        if (IsWordChar(c)) {
            current += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

Corpus Corpus::Build(const std::string& text) {
    return Build(text, Options());
}

Corpus Corpus::Build(const std::string& text, const Options& options) {
    if (options.window < 1) {
        throw InvalidConfiguration("window must be >= 1, got " + std::to_string(options.window));
    }

    std::unordered_set<std::string> stop_words;
    for (const auto& word : options.stop_words) {
        stop_words.insert(Normalize(word));
    }

    Corpus corpus;
    std::vector<std::string> tokens = Tokenize(text, stop_words);
    corpus.vocab_.LearnFromTokens(tokens, options.min_count);

    // 过滤掉低频词后的 id 序列，窗口在这个序列上滑动
    std::vector<int> ids;
    ids.reserve(tokens.size());
    for (const auto& token : tokens) {
        int index = corpus.vocab_.GetWordIndex(token);
        if (index != -1) ids.push_back(index);
    }

    // 每个无序词对只记录一次（向前看 window 个词），对称性由共现矩阵构建负责
    for (size_t pos = 0; pos < ids.size(); ++pos) {
        for (int d = 1; d <= options.window; ++d) {
            size_t context_pos = pos + d;
            if (context_pos >= ids.size()) break;
            corpus.pairs_.push_back({ids[pos], ids[context_pos], d});
        }
    }
    return corpus;
}

Corpus Corpus::BuildFromFile(const std::string& filename) {
    return BuildFromFile(filename, Options());
}

Corpus Corpus::BuildFromFile(const std::string& filename, const Options& options) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open training file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return Build(buffer.str(), options);
}

void Corpus::Save(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open corpus file for writing: " + filename);
    }

    file << kCorpusMagic << " " << kCorpusVersion << "\n";
    file << vocab_.Size() << " " << pairs_.size() << "\n";
    vocab_.Save(file);
    for (const auto& pair : pairs_) {
        file << pair.first << " " << pair.second << " " << pair.distance << "\n";
    }

    if (!file) {
        throw std::runtime_error("Failed writing corpus file: " + filename);
    }
}

Corpus Corpus::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open corpus file: " + filename);
    }

    std::string magic;
    int version = 0;
    size_t vocab_size = 0;
    size_t num_pairs = 0;
    if (!(file >> magic >> version) || magic != kCorpusMagic) {
        throw DataIntegrityError(filename + " is not a corpus file");
    }
    if (version != kCorpusVersion) {
        throw DataIntegrityError("unsupported corpus version " + std::to_string(version));
    }
    if (!(file >> vocab_size >> num_pairs)) {
        throw DataIntegrityError("corpus header truncated in " + filename);
    }

    Corpus corpus;
    corpus.vocab_.Load(file, vocab_size);

    const int size = static_cast<int>(vocab_size);
    corpus.pairs_.reserve(num_pairs);
    for (size_t i = 0; i < num_pairs; ++i) {
        TokenPair pair{};
        if (!(file >> pair.first >> pair.second >> pair.distance)) {
            throw DataIntegrityError("corpus pairs truncated after " + std::to_string(i) +
                                     " of " + std::to_string(num_pairs));
        }
        if (pair.first < 0 || pair.first >= size || pair.second < 0 ||
            pair.second >= size || pair.distance < 1) {
            throw DataIntegrityError("corpus pair " + std::to_string(i) + " out of range");
        }
        corpus.pairs_.push_back(pair);
    }
    return corpus;
}

} // namespace glove
