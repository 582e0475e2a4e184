#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace glove {

// 固定大小的工作线程池。共现矩阵构建和每个训练 epoch 都通过 RunAndWait
// 提交一批任务并同步等待（即 epoch 末尾的屏障）。
class ThreadPool {
public:
    explicit ThreadPool(int num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    int Size() const { return static_cast<int>(workers_.size()); }

    // 提交单个任务，异常通过 future 传回
    std::future<void> Submit(std::function<void()> task);

    // 提交 task(0) ... task(num_tasks - 1) 并等待全部完成。
    // 所有任务结束后才重新抛出第一个失败任务的异常。
    void RunAndWait(int num_tasks, const std::function<void(int)>& task);

private:
    std::vector<std::thread> workers_;
    std::queue<std::packaged_task<void()>> tasks_;
    std::mutex tasks_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;

    void WorkerLoop();
    // 置停止标志并回收所有已启动的线程
    void Shutdown();
};

} // namespace glove
