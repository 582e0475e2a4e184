#include "thread_pool.hpp"
#include "errors.hpp"
#include <exception>
#include <string>

namespace glove {

ThreadPool::ThreadPool(int num_threads) {
    if (num_threads <= 0) {
        throw InvalidConfiguration("threads must be > 0, got " + std::to_string(num_threads));
    }
    workers_.reserve(num_threads);
    try {
        for (int i = 0; i < num_threads; ++i) {
            workers_.emplace_back(&ThreadPool::WorkerLoop, this);
        }
    } catch (const std::exception&) {
        // 析构函数不会运行，已启动的线程必须在这里收回
        Shutdown();
        throw;
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Shutdown() {
    {
        std::unique_lock<std::mutex> lock(tasks_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

std::future<void> ThreadPool::Submit(std::function<void()> task) {
    std::packaged_task<void()> packaged(std::move(task));
    std::future<void> result = packaged.get_future();
    {
        std::unique_lock<std::mutex> lock(tasks_mutex_);
        tasks_.push(std::move(packaged));
    }
    condition_.notify_one();
    return result;
}

void ThreadPool::RunAndWait(int num_tasks, const std::function<void(int)>& task) {
    std::vector<std::future<void>> results;
    results.reserve(num_tasks);
    for (int i = 0; i < num_tasks; ++i) {
        results.push_back(Submit([&task, i] { task(i); }));
    }

    // 先等所有任务结束，再抛异常，保证返回时没有线程还在访问共享状态
    std::exception_ptr first_error;
    for (auto& result : results) {
        try {
            result.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(tasks_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        // packaged_task 自己捕获异常并存入 future
        task();
    }
}

} // namespace glove
