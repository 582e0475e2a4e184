#include "trainer.hpp"
#include "errors.hpp"
#include "thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace glove {

namespace {

inline double Clip(double g) {
    return std::max(-Trainer::kGradientClip, std::min(Trainer::kGradientClip, g));
}

} // namespace

void Trainer::Config::Validate() const {
    if (!(learning_rate > 0)) {
        throw InvalidConfiguration("learning_rate must be > 0, got " + std::to_string(learning_rate));
    }
    if (!(alpha > 0 && alpha <= 1)) {
        throw InvalidConfiguration("alpha must be in (0, 1], got " + std::to_string(alpha));
    }
    if (!(max_count > 0)) {
        throw InvalidConfiguration("max_count must be > 0, got " + std::to_string(max_count));
    }
    if (epochs < 0) {
        throw InvalidConfiguration("epochs must be >= 0, got " + std::to_string(epochs));
    }
}

Trainer::Trainer(ThreadPool& pool, const Config& config)
    : pool_(pool), config_(config) {
    config_.Validate();
    rng_.seed(config_.seed != 0 ? config_.seed : std::random_device{}());
    if (config_.update_mode == UpdateMode::kRowLocked) {
        row_locks_ = std::make_unique<std::mutex[]>(kLockStripes);
    }
}

double Trainer::Weight(double count, double max_count, double alpha) {
    if (count < max_count) {
        return std::pow(count / max_count, alpha);
    }
    return 1.0;
}

void Trainer::Train(VectorSpace& space, const CooccurrenceMatrix& cooc) {
    if (space.VocabSize() != cooc.Size()) {
        throw std::invalid_argument("Vector space has " + std::to_string(space.VocabSize()) +
                                    " rows but co-occurrence matrix is " +
                                    std::to_string(cooc.Size()) + " wide");
    }

    auto start_time = std::chrono::steady_clock::now();

    // 非零坐标只计算一次，每轮重新打乱
    std::vector<MatrixEntry> entries = cooc.NonZeroEntries();

    if (config_.verbose) {
        std::cout << "Starting training...\n";
        std::cout << "Vocabulary size: " << space.VocabSize() << "\n";
        std::cout << "Non-zero entries: " << entries.size() << "\n";
        std::cout << "Threads: " << pool_.Size() << "\n";
    }

    state_ = State::kRunning;
    epochs_completed_ = 0;
    epoch_losses_.clear();

    for (int epoch = 1; epoch <= config_.epochs; ++epoch) {
        std::shuffle(entries.begin(), entries.end(), rng_);

        // 一轮是原子单位：失败时恢复到轮前状态
        VectorSpace snapshot = space;
        double loss = 0.0;
        try {
            loss = TrainEpoch(space, cooc, entries);
        } catch (const std::exception& e) {
            space = std::move(snapshot);
            state_ = State::kFailed;
            std::cerr << "Epoch " << epoch << " aborted: " << e.what() << "\n";
            throw;
        }

        epoch_losses_.push_back(loss);
        epochs_completed_ = epoch;

        if (config_.verbose) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time).count();
            printf("Epoch %d/%d  Loss: %f  Elapsed: %.2fs\n",
                   epoch, config_.epochs, loss, elapsed / 1000.0);
            fflush(stdout);
        }
    }

    state_ = State::kDone;
}

double Trainer::TrainEpoch(VectorSpace& space, const CooccurrenceMatrix& cooc,
                           const std::vector<MatrixEntry>& entries) {
    if (entries.empty()) return 0.0;

    // 打乱后的条目平均切成连续、互不相交的块，每个线程一块；
    // 确定性模式只切一块，由一个线程按打乱后的顺序执行
    const int num_chunks = config_.update_mode == UpdateMode::kDeterministic ? 1 : pool_.Size();
    const size_t chunk = (entries.size() + num_chunks - 1) / num_chunks;
    std::vector<double> chunk_losses(num_chunks, 0.0);

    pool_.RunAndWait(num_chunks, [&](int thread_id) {
        const size_t begin = std::min(entries.size(), chunk * thread_id);
        const size_t end = std::min(entries.size(), begin + chunk);

        double local_loss = 0.0;
        for (size_t k = begin; k < end; ++k) {
            const MatrixEntry& entry = entries[k];
            const double count = cooc.Get(entry.row, entry.col);

            if (config_.update_mode == UpdateMode::kRowLocked) {
                // 按分段编号顺序加锁，避免死锁；同一分段只锁一次
                int a = entry.row % kLockStripes;
                int b = entry.col % kLockStripes;
                if (a > b) std::swap(a, b);
                std::unique_lock<std::mutex> first(row_locks_[a]);
                std::unique_lock<std::mutex> second;
                if (b != a) second = std::unique_lock<std::mutex>(row_locks_[b]);
                local_loss += UpdateEntry(space, entry.row, entry.col, count);
            } else {
                local_loss += UpdateEntry(space, entry.row, entry.col, count);
            }
        }
        chunk_losses[thread_id] = local_loss;
    });

    double total = 0.0;
    for (double loss : chunk_losses) total += loss;
    return total / entries.size();
}

double Trainer::UpdateEntry(VectorSpace& space, int row, int col, double count) const {
    // =============================================================================
    // 单个共现条目 (i, j) 的 AdaGrad 更新
    // =============================================================================
    //
    // 目标：J = f(X_ij) * (w_i·w_j + b_i + b_j - log X_ij)^2
    //
    // 梯度（省略常数 2）：
    //   dJ/dw_i = f * cost * w_j
    //   dJ/dw_j = f * cost * w_i
    //   dJ/db_i = dJ/db_j = f * cost
    //
    // 每个分量先裁剪到 [-100, 100]，再按 AdaGrad 更新：
    //   G += g^2
    //   p -= lr * g / sqrt(G)
    // G 跨 epoch 累积，所以每个参数的有效学习率单调不增。
    // =============================================================================

    const size_t dim = space.Dimension();
    double* vec_i = space.Vector(row);
    double* vec_j = space.Vector(col);
    double* gradsq_i = space.VectorGradSq(row);
    double* gradsq_j = space.VectorGradSq(col);

    const double weight = Weight(count, config_.max_count, config_.alpha);
    const double prediction = Dot(vec_i, vec_j, dim) + space.Bias(row) + space.Bias(col);
    const double cost = prediction - std::log(count);
    const double weighted_cost = weight * cost;
    // Clip 对 NaN 无效（std::min 会返回上限），必须在这里拦下
    if (!std::isfinite(weighted_cost)) {
        throw std::domain_error("Non-finite cost at (" + std::to_string(row) + ", " +
                                std::to_string(col) + "), co-occurrence " +
                                std::to_string(count));
    }
    const double lr = config_.learning_rate;

    for (size_t c = 0; c < dim; ++c) {
        // 两个梯度都用更新前的分量
        const double grad_i = Clip(weighted_cost * vec_j[c]);
        const double grad_j = Clip(weighted_cost * vec_i[c]);

        gradsq_i[c] += grad_i * grad_i;
        vec_i[c] -= lr * grad_i / std::sqrt(gradsq_i[c]);

        gradsq_j[c] += grad_j * grad_j;
        vec_j[c] -= lr * grad_j / std::sqrt(gradsq_j[c]);
    }

    const double grad_bias = Clip(weighted_cost);

    double& bias_gradsq_i = space.BiasGradSq(row);
    bias_gradsq_i += grad_bias * grad_bias;
    space.Bias(row) -= lr * grad_bias / std::sqrt(bias_gradsq_i);

    double& bias_gradsq_j = space.BiasGradSq(col);
    bias_gradsq_j += grad_bias * grad_bias;
    space.Bias(col) -= lr * grad_bias / std::sqrt(bias_gradsq_j);

    return weighted_cost * weighted_cost;
}

} // namespace glove
