#include "model.hpp"
#include "cooccurrence.hpp"
#include "errors.hpp"
#include "thread_pool.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace glove {

namespace {

// 原生字节序的 double 数组，无头部
void WriteDoubles(const std::string& filename, const std::vector<double>& values) {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    file.write(reinterpret_cast<const char*>(values.data()),
               values.size() * sizeof(double));
    if (!file) {
        throw std::runtime_error("Failed writing " + filename);
    }
}

// 文件大小必须正好是 expected 个 double，不做截断
std::vector<double> ReadDoubles(const std::string& filename, size_t expected,
                                const std::string& what) {
    std::ifstream file(filename, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    const std::streamoff bytes = file.tellg();
    const std::streamoff expected_bytes = static_cast<std::streamoff>(expected * sizeof(double));
    if (bytes != expected_bytes) {
        throw DataIntegrityError(what + " in " + filename + " has " + std::to_string(bytes) +
                                 " bytes, expected " + std::to_string(expected_bytes));
    }

    std::vector<double> values(expected);
    file.seekg(0);
    file.read(reinterpret_cast<char*>(values.data()), expected_bytes);
    if (!file) {
        throw std::runtime_error("Failed reading " + filename);
    }
    return values;
}

// 共现矩阵必须有限、非负且对称，否则训练时 log(X_ij) 没有意义
void CheckCooccurrenceCells(const std::vector<double>& cells, size_t size,
                            const std::string& filename) {
    for (size_t i = 0; i < size; ++i) {
        for (size_t j = 0; j < size; ++j) {
            const double value = cells[i * size + j];
            const std::string where = "co-occurrence cell (" + std::to_string(i) + ", " +
                                      std::to_string(j) + ") in " + filename;
            if (!std::isfinite(value) || value < 0.0) {
                throw DataIntegrityError(where + " is " + std::to_string(value));
            }
            if (j > i && value != cells[j * size + i]) {
                throw DataIntegrityError(where + " does not match its transpose");
            }
        }
    }
}

} // namespace

void GloveModel::Config::Validate() const {
    if (threads <= 0) {
        throw InvalidConfiguration("threads must be > 0, got " + std::to_string(threads));
    }
    if (num_components <= 0) {
        throw InvalidConfiguration("num_components must be > 0, got " +
                                   std::to_string(num_components));
    }
    if (window < 1) {
        throw InvalidConfiguration("window must be >= 1, got " + std::to_string(window));
    }
    TrainerConfig().Validate();
}

Trainer::Config GloveModel::Config::TrainerConfig() const {
    Trainer::Config trainer_config;
    trainer_config.learning_rate = learning_rate;
    trainer_config.alpha = alpha;
    trainer_config.max_count = max_count;
    trainer_config.epochs = epochs;
    trainer_config.update_mode = update_mode;
    trainer_config.seed = seed;
    trainer_config.verbose = verbose;
    return trainer_config;
}

Corpus::Options GloveModel::Config::CorpusOptions() const {
    Corpus::Options options;
    options.window = window;
    options.min_count = min_count;
    options.stop_words = stop_words;
    return options;
}

GloveModel::GloveModel() : GloveModel(Config()) {}

GloveModel::GloveModel(const Config& config) : config_(config) {
    // 先校验，再分配线程和内存
    config_.Validate();
    pool_ = std::make_unique<ThreadPool>(config_.threads);
    trainer_ = std::make_unique<Trainer>(*pool_, config_.TrainerConfig());
}

GloveModel::~GloveModel() = default;

GloveModel& GloveModel::Fit(const std::string& text) {
    return Fit(Corpus::Build(text, config_.CorpusOptions()));
}

GloveModel& GloveModel::Fit(Corpus corpus) {
    if (corpus.Size() == 0) {
        throw std::invalid_argument("Cannot fit an empty corpus");
    }

    CooccurrenceBuilder builder(*pool_);
    CooccurrenceMatrix cooc = builder.Build(corpus.pairs(), corpus.Size());
    auto space = std::make_unique<VectorSpace>(static_cast<int>(corpus.Size()),
                                               config_.num_components, config_.seed);

    // 全部成功后再替换当前状态
    query_.reset();
    corpus_ = std::move(corpus);
    cooc_matrix_ = std::move(cooc);
    space_ = std::move(space);
    query_ = std::make_unique<QueryEngine>(corpus_.vocab(), *space_);

    if (config_.verbose) {
        std::cout << "Vocabulary size: " << corpus_.Size() << "\n";
        std::cout << "Token pairs: " << corpus_.pairs().size() << "\n";
        std::cout << "Non-zero co-occurrences: " << cooc_matrix_.NonZeroCount() << "\n";
    }
    return *this;
}

GloveModel& GloveModel::Train() {
    RequireFitted("Train");
    trainer_->Train(*space_, cooc_matrix_);
    return *this;
}

void GloveModel::Save(const std::string& corpus_file, const std::string& cooc_file,
                      const std::string& vec_file, const std::string& bias_file) const {
    RequireFitted("Save");

    corpus_.Save(corpus_file);
    WriteDoubles(cooc_file, cooc_matrix_.ToDense());
    WriteDoubles(vec_file, space_->vectors().Data());
    WriteDoubles(bias_file, space_->biases());

    if (config_.verbose) {
        std::cout << "Model saved to " << corpus_file << ", " << cooc_file << ", "
                  << vec_file << ", " << bias_file << "\n";
    }
}

void GloveModel::Load(const std::string& corpus_file, const std::string& cooc_file,
                      const std::string& vec_file, const std::string& bias_file) {
    // V 以语料文件为准，其余三个文件按 V 和 num_components 校验大小
    Corpus corpus = Corpus::Load(corpus_file);
    const size_t size = corpus.Size();
    const size_t dim = config_.num_components;
    if (size == 0) {
        throw DataIntegrityError("corpus in " + corpus_file + " has an empty vocabulary");
    }

    std::vector<double> cells = ReadDoubles(cooc_file, size * size, "co-occurrence matrix");
    CheckCooccurrenceCells(cells, size, cooc_file);
    CooccurrenceMatrix cooc = CooccurrenceMatrix::FromDense(cells, size);

    DenseMatrix vectors(size, dim);
    vectors.Data() = ReadDoubles(vec_file, size * dim, "word vector matrix");
    std::vector<double> biases = ReadDoubles(bias_file, size, "bias vector");

    query_.reset();
    corpus_ = std::move(corpus);
    cooc_matrix_ = std::move(cooc);
    space_ = std::make_unique<VectorSpace>(std::move(vectors), std::move(biases));
    query_ = std::make_unique<QueryEngine>(corpus_.vocab(), *space_);

    if (config_.verbose) {
        std::cout << "Model loaded: " << size << " words, " << dim << " components\n";
    }
}

void GloveModel::SaveVectorsText(const std::string& filename) const {
    RequireFitted("SaveVectorsText");

    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open vector file for writing: " + filename);
    }

    const Vocabulary& vocab = corpus_.vocab();
    file << vocab.Size() << " " << space_->Dimension() << "\n";
    for (size_t i = 0; i < vocab.Size(); ++i) {
        file << vocab.GetWord(i).word;
        const double* vec = space_->Vector(i);
        for (size_t c = 0; c < space_->Dimension(); ++c) {
            file << " " << vec[c];
        }
        file << "\n";
    }
}

SimilarWords GloveModel::MostSimilar(const std::string& word, int num) const {
    RequireFitted("MostSimilar");
    return query_->MostSimilar(word, num);
}

bool GloveModel::Contains(const std::string& word) const {
    RequireFitted("Contains");
    return query_->Contains(word);
}

SimilarWords GloveModel::AnalogyWords(const std::string& word1, const std::string& word2,
                                      const std::string& target, int num,
                                      double accuracy) const {
    RequireFitted("AnalogyWords");
    return query_->AnalogyWords(word1, word2, target, num, accuracy);
}

void GloveModel::Visualize() const {
    throw NotImplementedError("Visualize");
}

const VectorSpace& GloveModel::vector_space() const {
    RequireFitted("vector_space");
    return *space_;
}

void GloveModel::RequireFitted(const char* operation) const {
    if (!space_) {
        throw std::logic_error(std::string(operation) + " requires Fit() or Load() first");
    }
}

} // namespace glove
