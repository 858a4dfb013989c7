/**
 * @file worker_pool.hpp
 * @brief Пул потоков для независимых единиц работы (строки документа,
 *        фрагменты файла словаря)
 */

#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

#include "atomspell/concurrent_queue.hpp"
#include "atomspell/types.hpp"

namespace atomspell {

/**
 * @brief Число потоков по настройке: 0 означает hardware_concurrency
 */
[[nodiscard]] inline std::size_t resolve_thread_count(std::size_t configured) {
  if (configured != 0) {
    return configured;
  }
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : static_cast<std::size_t>(hw);
}

/**
 * @brief Пул std::jthread с очередями задач и результатов
 *
 * Каждая задача получает порядковый номер при постановке; map() возвращает
 * результаты в порядке исходных задач независимо от порядка выполнения.
 * Исключение обработчика логируется, слот задачи получает Result{}.
 *
 * @tparam Task   Входная единица работы
 * @tparam Result Результат обработки одной задачи
 */
template <class Task, class Result> class WorkerPool {
public:
  using Handler = std::function<Result(Task &)>;

  explicit WorkerPool(Handler handler) : handler_{std::move(handler)} {}

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  ~WorkerPool() { stop(); }

  void start(std::size_t threads) {
    if (!threads_.empty()) {
      return;
    }

    if (threads == 0) {
      threads = 1;
    }

    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
      threads_.emplace_back([this](std::stop_token st) { worker_main(st); });
    }
  }

  void stop() {
    for (auto &t : threads_) {
      t.request_stop();
    }
    tasks_.notify_all();
    threads_.clear();
  }

  [[nodiscard]] std::size_t thread_count() const noexcept {
    return threads_.size();
  }

  /**
   * @brief Обрабатывает все задачи и возвращает результаты по порядку
   *
   * Блокирует вызывающий поток до получения всех результатов.
   */
  [[nodiscard]] std::vector<Result> map(std::vector<Task> tasks) {
    const std::size_t count = tasks.size();
    if (threads_.empty()) {
      // Пул не запущен: выполняем в вызывающем потоке
      std::vector<Result> out;
      out.reserve(count);
      for (auto &task : tasks) {
        out.push_back(run_task(task));
      }
      return out;
    }

    std::vector<Envelope> batch;
    batch.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      batch.push_back(Envelope{i, std::move(tasks[i])});
    }
    tasks_.push_all(std::move(batch));

    std::vector<std::optional<Result>> slots(count);
    for (std::size_t received = 0; received < count; ++received) {
      auto done = results_.pop_wait();
      if (!done.has_value()) {
        break;
      }
      slots[done->index] = std::move(done->result);
    }

    std::vector<Result> out;
    out.reserve(count);
    for (auto &slot : slots) {
      out.push_back(slot.has_value() ? std::move(*slot) : Result{});
    }
    return out;
  }

private:
  struct Envelope {
    std::size_t index = 0;
    Task task;
  };

  struct Done {
    std::size_t index = 0;
    Result result;
  };

  Result run_task(Task &task) {
    try {
      return handler_(task);
    } catch (const std::exception &e) {
      std::cerr << kLogPrefix << "Warning: worker task failed: " << e.what()
                << "\n";
    }
    return Result{};
  }

  void worker_main(std::stop_token st) {
    while (!st.stop_requested()) {
      auto opt = tasks_.pop_wait(st);
      if (!opt.has_value()) {
        break;
      }

      Envelope env = std::move(*opt);
      results_.push(Done{env.index, run_task(env.task)});
    }
  }

  Handler handler_;

  ConcurrentQueue<Envelope> tasks_;
  ConcurrentQueue<Done> results_;

  std::vector<std::jthread> threads_;
};

} // namespace atomspell
