#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <condition_variable>
#include <stop_token>
#include <stdexcept>

namespace pcopy::infra {

/// Потокобезопасная очередь задач с явным закрытием.
/// take() блокируется, пока очередь пуста, но не закрыта; возвращает
/// std::nullopt после закрытия и опустошения (исчерпание) либо по stop_token.
template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void push(T item);

    // После close() новых задач не будет
    void close();

    [[nodiscard]] auto take(std::stop_token st = {}) -> std::optional<T>;

    // Сбрасывает оставшиеся задачи, возвращает их количество
    auto drain() -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto taken() const -> std::size_t;

private:
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    bool closed_ = false;
    std::size_t taken_ = 0;
};

// =============== Реализация шаблонов ===============

template<typename T>
void WorkQueue<T>::push(T item) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            throw std::logic_error("WorkQueue is closed");
        }
        items_.push_back(std::move(item));
    }
    cv_.notify_one();
}

template<typename T>
void WorkQueue<T>::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

template<typename T>
auto WorkQueue<T>::take(std::stop_token st) -> std::optional<T> {
    std::unique_lock lock(mutex_);
    const bool ready = cv_.wait(lock, st, [this] {
        return !items_.empty() || closed_;
    });
    // После запроса остановки новые задачи не выдаются даже из непустой очереди
    if (!ready || st.stop_requested() || items_.empty()) {
        return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    ++taken_;
    return item;
}

template<typename T>
auto WorkQueue<T>::drain() -> std::size_t {
    std::lock_guard lock(mutex_);
    const auto n = items_.size();
    items_.clear();
    return n;
}

template<typename T>
auto WorkQueue<T>::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return items_.size();
}

template<typename T>
auto WorkQueue<T>::taken() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return taken_;
}

} // namespace pcopy::infra
