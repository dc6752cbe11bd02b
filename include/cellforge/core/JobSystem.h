#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace cellforge::core {

// Small fixed-size thread pool.
//
//  - header-only.
//  - parallelFor() also runs one work loop on the calling thread, so a pool
//    of N threads gives N+1 lanes. Do not call it from inside a pool task.
//  - no work stealing, no task graph; raster kernels only need a parallel map.
class JobSystem {
public:
  // threadCount == 0 picks hardware_concurrency() (fallback 4).
  explicit JobSystem(std::size_t threadCount = 0) {
    if (threadCount == 0) threadCount = defaultThreadCount();
    threadCount_ = threadCount;

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
      threads_.emplace_back([this]() { workerLoop(); });
    }
  }

  ~JobSystem() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
  }

  JobSystem(const JobSystem&) = delete;
  JobSystem& operator=(const JobSystem&) = delete;

  std::size_t threadCount() const { return threadCount_; }

  static std::size_t defaultThreadCount() {
    const unsigned hc = std::thread::hardware_concurrency();
    return hc > 0 ? static_cast<std::size_t>(hc) : 4;
  }

  template <class F>
  auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> fut = task->get_future();

    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (stopping_) {
        lock.unlock();
        (*task)();
        return fut;
      }
      queue_.emplace_back([task]() { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  // Block until the queue is drained and no worker is busy.
  void waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idleCv_.wait(lock, [&]() { return queue_.empty() && active_ == 0; });
  }

  // Call fn(i) exactly once for every i in [0, count).
  //
  // grain == 0 picks a block size giving roughly four blocks per lane.
  template <class Fn>
  void parallelFor(std::size_t count, Fn&& fn, std::size_t grain = 0) {
    if (count == 0) return;

    if (count == 1) {
      fn(0);
      return;
    }

    const std::size_t lanes = threadCount_ + 1;
    if (grain == 0) {
      grain = count / (lanes * 4);
      if (grain < 1) grain = 1;
    }

    std::atomic<std::size_t> next{0};
    auto workLoop = [&]() {
      for (;;) {
        const std::size_t start = next.fetch_add(grain, std::memory_order_relaxed);
        if (start >= count) break;
        const std::size_t end = (start + grain < count) ? (start + grain) : count;
        for (std::size_t i = start; i < end; ++i) fn(i);
      }
    };

    std::vector<std::future<void>> futs;
    futs.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
      futs.push_back(submit(workLoop));
    }

    workLoop();
    for (auto& f : futs) f.get();
  }

private:
  void workerLoop() {
    for (;;) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]() { return stopping_ || !queue_.empty(); });
        if (stopping_ && queue_.empty()) return;

        task = std::move(queue_.front());
        queue_.pop_front();
        ++active_;
      }

      task();

      {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
        if (queue_.empty() && active_ == 0) idleCv_.notify_all();
      }
    }
  }

  std::size_t threadCount_{0};
  std::vector<std::thread> threads_{};

  std::mutex mutex_{};
  std::condition_variable cv_{};
  std::condition_variable idleCv_{};

  std::deque<std::function<void()>> queue_{};
  std::size_t active_{0};
  bool stopping_{false};
};

} // namespace cellforge::core
