#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <stop_token>
#include <vector>

namespace pcopy::infra {

/// Пул фиксированного размера: каждый поток один раз вызывает worker
/// (тот сам забирает задачи из очереди) и завершается.
class ThreadPool {
public:
    using Worker = std::function<void(std::stop_token, std::size_t /*index*/)>;

    ThreadPool(std::size_t nthreads, Worker worker);
    ~ThreadPool();

    // Удалить копирование и присваивание
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Просит потоки остановиться после текущей операции
    void request_stop();

    // Блокирующее ожидание завершения всех потоков
    void wait();

    // true, если все потоки завершились до истечения timeout
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }
    [[nodiscard]] auto live() const -> std::size_t;

private:
    Worker worker_;
    std::stop_source stop_;
    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    std::size_t live_ = 0;
    std::vector<std::jthread> workers_;
};

} // namespace pcopy::infra

namespace pcopy::infra {

inline ThreadPool::ThreadPool(std::size_t nthreads, Worker worker)
    : worker_(std::move(worker))
    , live_(nthreads)
{
    workers_.reserve(nthreads);

    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this, i] {
            worker_(stop_.get_token(), i);
            {
                std::lock_guard lock(mutex_);
                --live_;
            }
            done_cv_.notify_all();
        });
    }
}

inline ThreadPool::~ThreadPool() {
    request_stop();
    // jthread автоматически join() в деструкторе
}

inline void ThreadPool::request_stop() {
    stop_.request_stop();
}

inline void ThreadPool::wait() {
    std::unique_lock lock(mutex_);
    done_cv_.wait(lock, [this] { return live_ == 0; });
}

inline auto ThreadPool::wait_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return live_ == 0; });
}

inline auto ThreadPool::live() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return live_;
}

} // namespace pcopy::infra
