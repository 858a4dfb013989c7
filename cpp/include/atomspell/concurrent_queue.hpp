/**
 * @file concurrent_queue.hpp
 * @brief Потокобезопасная очередь задач и результатов пула потоков
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace atomspell {

/**
 * @brief Очередь с блокирующим извлечением
 *
 * После close() новые элементы не принимаются, а pop_wait() дочитывает
 * остаток и затем возвращает std::nullopt.
 */
template <class T> class ConcurrentQueue {
public:
  ConcurrentQueue() = default;

  ConcurrentQueue(const ConcurrentQueue &) = delete;
  ConcurrentQueue &operator=(const ConcurrentQueue &) = delete;

  /// @return false если очередь уже закрыта
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_) {
        return false;
      }
      q_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  /// Кладёт пачку элементов под одной блокировкой
  bool push_all(std::vector<T> values) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_) {
        return false;
      }
      for (auto &v : values) {
        q_.push_back(std::move(v));
      }
    }
    cv_.notify_all();
    return true;
  }

  [[nodiscard]] bool try_pop(T &out) {
    std::lock_guard<std::mutex> lock(mu_);
    if (q_.empty()) {
      return false;
    }
    out = std::move(q_.front());
    q_.pop_front();
    return true;
  }

  /**
   * @brief Ждёт элемент, остановку потока или закрытие очереди
   */
  [[nodiscard]] std::optional<T> pop_wait(std::stop_token st) {
    std::unique_lock<std::mutex> lock(mu_);

    cv_.wait(lock, st, [this] { return !q_.empty() || closed_; });

    if (q_.empty()) {
      return std::nullopt;
    }

    T value = std::move(q_.front());
    q_.pop_front();
    return value;
  }

  /// Блокирующее извлечение для потока без stop_token
  [[nodiscard]] std::optional<T> pop_wait() {
    return pop_wait(std::stop_token{});
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  void notify_all() { cv_.notify_all(); }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
  }

private:
  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  std::deque<T> q_;
  bool closed_ = false;
};

} // namespace atomspell
