#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <vector>
#include "sparse_matrix.hpp"
#include "vector_space.hpp"

namespace glove {

class ThreadPool;

// 并发更新策略
enum class UpdateMode {
    kLockFree,   // Hogwild：不加锁，多线程时结果不确定，最快
    kRowLocked,  // 分段行锁：同一条目涉及的两行在更新期间加锁，不保证可复现
    kDeterministic,  // 只用一个训练线程，相同种子的结果逐位相同
};

class Trainer {
public:
    struct Config {
        double learning_rate = 0.05;     // AdaGrad 初始学习率
        double alpha = 0.75;             // 加权函数指数
        double max_count = 100;          // 加权函数截断点 x_max
        int epochs = 5;                  // 迭代轮数
        UpdateMode update_mode = UpdateMode::kLockFree;
        uint64_t seed = 0;               // 打乱顺序的随机种子，0 = random_device
        bool verbose = false;

        Config() = default;

        // 非法时抛 InvalidConfiguration
        void Validate() const;
    };

    enum class State { kNotStarted, kRunning, kDone, kFailed };

    // 梯度裁剪上限
    static constexpr double kGradientClip = 100.0;
    static constexpr int kLockStripes = 1024;

    Trainer(ThreadPool& pool, const Config& config);

    // 在 space 上原地训练 config.epochs 轮。
    // 每轮以屏障结束；某个线程失败时该轮回滚到轮前状态并重新抛出异常。
    // 共现值非正或代价非有限时抛 std::domain_error。
    void Train(VectorSpace& space, const CooccurrenceMatrix& cooc);

    // f(w) = (w / max_count)^alpha，w >= max_count 时为 1
    static double Weight(double count, double max_count, double alpha);

    State state() const { return state_; }
    int epochs_completed() const { return epochs_completed_; }
    // 每轮的平均加权平方误差
    const std::vector<double>& epoch_losses() const { return epoch_losses_; }

private:
    ThreadPool& pool_;
    Config config_;
    std::mt19937_64 rng_;
    std::unique_ptr<std::mutex[]> row_locks_;

    State state_ = State::kNotStarted;
    int epochs_completed_ = 0;
    std::vector<double> epoch_losses_;

    double TrainEpoch(VectorSpace& space, const CooccurrenceMatrix& cooc,
                      const std::vector<MatrixEntry>& entries);
    double UpdateEntry(VectorSpace& space, int row, int col, double count) const;
};

} // namespace glove
