#include "cellforge/core/JobSystem.h"

#include "test_harness.h"

#include <atomic>
#include <cstddef>
#include <vector>

int test_jobs() {
  int failures = 0;

  using cellforge::core::JobSystem;

  // ---- submit() returns values ----
  {
    JobSystem js(4);
    CHECK(js.threadCount() == 4u);
    auto f = js.submit([]() { return 123; });
    CHECK(f.get() == 123);
  }

  // ---- waitIdle() drains all queued work ----
  {
    JobSystem js(4);
    std::atomic<int> c{0};
    for (int i = 0; i < 1000; ++i) {
      js.submit([&]() { c.fetch_add(1, std::memory_order_relaxed); });
    }
    js.waitIdle();
    CHECK(c.load(std::memory_order_relaxed) == 1000);
  }

  // ---- parallelFor() executes each index exactly once ----
  {
    JobSystem js(4);
    std::vector<std::atomic<int>> hits(10'000);
    js.parallelFor(hits.size(), [&](std::size_t i) {
      hits[i].fetch_add(1, std::memory_order_relaxed);
    });
    bool once = true;
    for (const auto& h : hits) {
      if (h.load(std::memory_order_relaxed) != 1) once = false;
    }
    CHECK(once);
  }

  // ---- explicit grain, including one larger than the range ----
  {
    JobSystem js(2);
    std::atomic<std::size_t> sum{0};
    js.parallelFor(100, [&](std::size_t i) { sum.fetch_add(i, std::memory_order_relaxed); }, 1);
    CHECK(sum.load() == 4950u);

    sum = 0;
    js.parallelFor(100, [&](std::size_t i) { sum.fetch_add(i, std::memory_order_relaxed); }, 1000);
    CHECK(sum.load() == 4950u);
  }

  return failures;
}
