#pragma once

#include <atomic>
#include <cstddef>
#include <future>
#include <vector>

namespace rankbpe {

// 0 -> hardware concurrency, or 4 when that is unknown.
std::size_t EffectiveThreads(std::size_t configured);

// Runs fn(i) for every i in [0, jobs) on `workers` threads pulling indices
// from a shared counter. The first exception stops the remaining workers and
// is rethrown to the caller.
template <typename Fn>
void ParallelFor(std::size_t jobs, std::size_t workers, const Fn& fn) {
  if (workers <= 1) {
    for (std::size_t i = 0; i < jobs; ++i) {
      fn(i);
    }
    return;
  }

  std::atomic<std::size_t> next_idx{0};
  std::atomic<bool> had_error{false};
  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    futures.push_back(std::async(std::launch::async, [&] {
      try {
        while (!had_error.load(std::memory_order_relaxed)) {
          const std::size_t i = next_idx.fetch_add(1, std::memory_order_relaxed);
          if (i >= jobs) {
            return;
          }
          fn(i);
        }
      } catch (...) {
        had_error.store(true, std::memory_order_relaxed);
        throw;
      }
    }));
  }
  for (auto& future : futures) {
    future.wait();
  }
  for (auto& future : futures) {
    future.get();
  }
}

}  // namespace rankbpe
