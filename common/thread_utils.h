#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include <numa.h>
#include <pthread.h>
#include <sched.h>

#include "common/logging.h"

namespace Shield::Common {

  /// Set affinity for current thread to be pinned to the provided core_id
  inline auto setThreadCore(int core_id) noexcept -> bool {
    if (core_id < 0) {
      return false;
    }
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(static_cast<size_t>(core_id), &cpuset);

    return (pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0);
  }

  /// Set NUMA node preference for memory allocated by the current thread
  inline auto setNumaNode(int node_id) noexcept -> bool {
    if (node_id < 0 || numa_available() < 0) {
      return false;
    }
    if (node_id > numa_max_node()) {
      return false;
    }
    numa_set_preferred(node_id);
    return true;
  }

  /// Effective worker count: 0 means one per hardware thread, never more than
  /// the number of jobs
  inline auto resolveWorkerCount(uint32_t requested, size_t job_count) noexcept -> uint32_t {
    uint32_t workers = requested;
    if (workers == 0) {
      workers = std::thread::hardware_concurrency();
      if (workers == 0) {
        workers = 1;
      }
    }
    if (job_count < workers) {
      workers = static_cast<uint32_t>(job_count == 0 ? 1 : job_count);
    }
    return workers;
  }

  /// Placement of pool threads
  struct WorkerPlacement {
    bool pin_workers = false;  // pin worker i to first_core + i
    int first_core = 0;
    int numa_node = -1;        // -1 leaves the kernel default
  };

  /// Fixed-size pool of worker threads consuming a FIFO task queue
  class ThreadPool {
  public:
    ThreadPool(uint32_t worker_count, const WorkerPlacement& placement)
      : workers_(), tasks_(), queue_mutex_(), condition_() {
      const uint32_t hw = std::max(1U, std::thread::hardware_concurrency());
      workers_.reserve(worker_count);
      for (uint32_t i = 0; i < worker_count; ++i) {
        const int core_id = placement.pin_workers
            ? static_cast<int>((static_cast<uint32_t>(placement.first_core) + i) % hw)
            : -1;
        const int numa_node = placement.numa_node;
        workers_.emplace_back([this, core_id, numa_node, i] {
          if (core_id >= 0 && !setThreadCore(core_id)) {
            LOG_WARN("Worker %u: failed to pin to core %d", i, core_id);
          }
          if (numa_node >= 0 && !setNumaNode(numa_node)) {
            LOG_WARN("Worker %u: NUMA node %d unavailable", i, numa_node);
          }
          workerLoop();
        });
      }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool() {
      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_.store(true, std::memory_order_release);
      }
      condition_.notify_all();

      for (auto& worker : workers_) {
        if (worker.joinable()) {
          worker.join();
        }
      }
    }

    template<typename F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>> {
      using Result = std::invoke_result_t<F>;
      auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
      auto res = task->get_future();

      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_.load(std::memory_order_acquire)) {
          throw std::runtime_error("enqueue on stopped ThreadPool");
        }
        tasks_.emplace_back([task]() { (*task)(); });
      }

      condition_.notify_one();
      return res;
    }

    size_t size() const noexcept { return workers_.size(); }

  private:
    void workerLoop() {
      while (true) {
        std::function<void()> task;
        {
          std::unique_lock<std::mutex> lock(queue_mutex_);
          condition_.wait(lock, [this] {
            return stop_.load(std::memory_order_acquire) || !tasks_.empty();
          });

          if (stop_.load(std::memory_order_acquire) && tasks_.empty()) {
            return;
          }

          task = std::move(tasks_.front());
          tasks_.pop_front();
        }
        task();
      }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
  };

} // namespace Shield::Common
