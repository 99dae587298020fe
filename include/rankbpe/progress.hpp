#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace rankbpe {

// Thread-safe progress line on stderr: "[label] items done/total (pct%) ...".
// add() may be called from any worker; printing is rate limited to one line
// per interval_ms. interval_ms == 0 disables output entirely.
class ProgressTracker {
 public:
  ProgressTracker(std::uint64_t total_items, std::string label, std::uint64_t interval_ms);
  ProgressTracker(std::uint64_t total_items, std::string label, std::uint64_t interval_ms, std::ostream& out);

  void add(std::uint64_t items, std::uint64_t tokens);
  void finish();

  [[nodiscard]] std::uint64_t done_items() const { return done_items_.load(std::memory_order_relaxed); }
  [[nodiscard]] std::uint64_t done_tokens() const { return done_tokens_.load(std::memory_order_relaxed); }

 private:
  void maybe_print(bool force);

  std::string label_;
  std::uint64_t total_ = 0;
  std::uint64_t interval_ms_ = 1000;
  std::ostream& out_;
  std::atomic<std::uint64_t> done_items_{0};
  std::atomic<std::uint64_t> done_tokens_{0};
  std::chrono::steady_clock::time_point start_;
  std::atomic<std::int64_t> last_print_ns_{0};
  std::mutex print_mu_;
};

[[nodiscard]] std::string FormatDuration(double seconds);

}  // namespace rankbpe
