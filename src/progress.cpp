#include "rankbpe/progress.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace rankbpe {

namespace {

std::int64_t ElapsedNs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - since).count();
}

}  // namespace

std::string FormatDuration(double seconds) {
  const int sec = static_cast<int>(seconds + 0.5);
  const int h = sec / 3600;
  const int m = (sec % 3600) / 60;
  const int s = sec % 60;
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << h << ":" << std::setw(2) << m << ":" << std::setw(2) << s;
  return oss.str();
}

ProgressTracker::ProgressTracker(std::uint64_t total_items, std::string label, std::uint64_t interval_ms)
    : ProgressTracker(total_items, std::move(label), interval_ms, std::cerr) {}

ProgressTracker::ProgressTracker(std::uint64_t total_items,
                                 std::string label,
                                 std::uint64_t interval_ms,
                                 std::ostream& out)
    : label_(std::move(label)),
      total_(total_items),
      interval_ms_(interval_ms),
      out_(out),
      start_(std::chrono::steady_clock::now()) {}

void ProgressTracker::add(std::uint64_t items, std::uint64_t tokens) {
  done_items_.fetch_add(items, std::memory_order_relaxed);
  done_tokens_.fetch_add(tokens, std::memory_order_relaxed);
  maybe_print(false);
}

void ProgressTracker::finish() { maybe_print(true); }

void ProgressTracker::maybe_print(bool force) {
  if (interval_ms_ == 0) {
    return;
  }
  const auto interval_ns = static_cast<std::int64_t>(interval_ms_) * 1000000;
  if (!force && ElapsedNs(start_) - last_print_ns_.load(std::memory_order_relaxed) < interval_ns) {
    return;
  }
  std::lock_guard<std::mutex> lock(print_mu_);
  const std::int64_t now_ns = ElapsedNs(start_);
  if (!force && now_ns - last_print_ns_.load(std::memory_order_relaxed) < interval_ns) {
    return;
  }
  last_print_ns_.store(now_ns, std::memory_order_relaxed);

  const std::uint64_t done_items = done_items_.load(std::memory_order_relaxed);
  const std::uint64_t done_tokens = done_tokens_.load(std::memory_order_relaxed);
  const double elapsed = static_cast<double>(now_ns) / 1e9;
  const double item_rate = elapsed > 0.0 ? static_cast<double>(done_items) / elapsed : 0.0;
  const double token_rate = elapsed > 0.0 ? static_cast<double>(done_tokens) / elapsed : 0.0;
  const double eta =
      (item_rate > 0.0 && total_ > done_items) ? static_cast<double>(total_ - done_items) / item_rate : 0.0;

  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  if (total_ > 0) {
    const double pct = 100.0 * static_cast<double>(done_items) / static_cast<double>(total_);
    oss << "[" << label_ << "] items " << done_items << "/" << total_ << " (" << std::setprecision(1) << pct << "%)";
  } else {
    oss << "[" << label_ << "] items " << done_items;
  }
  if (done_tokens > 0) {
    oss << " tokens " << done_tokens;
  }
  if (item_rate > 0.0) {
    oss << " rate " << std::setprecision(2) << item_rate << " it/s";
  }
  if (token_rate > 0.0) {
    oss << " " << std::setprecision(2) << (token_rate / 1000.0) << " ktok/s";
  }
  if (eta > 0.0) {
    oss << " ETA " << FormatDuration(eta);
  }
  oss << "\n";
  out_ << oss.str();
}

}  // namespace rankbpe
