#include <atomic>
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "rankbpe/parallel.hpp"
#include "rankbpe/progress.hpp"

using namespace rankbpe;

namespace {

void TestEveryIndexOnce() {
  for (std::size_t workers : {1u, 3u, 8u}) {
    std::vector<std::atomic<int>> hits(1000);
    ParallelFor(hits.size(), workers, [&](std::size_t i) { hits[i].fetch_add(1); });
    for (const auto& h : hits) {
      assert(h.load() == 1);
    }
  }
  ParallelFor(0, 4, [](std::size_t) { assert(false); });
}

void TestPerItemCallbackFeedsProgress() {
  ProgressTracker progress(200, "items", 0);
  std::vector<std::size_t> lengths(200);
  ParallelFor(lengths.size(), 4, [&](std::size_t i) {
    lengths[i] = i % 7;
    progress.add(1, lengths[i]);
  });
  std::size_t expected_tokens = 0;
  for (std::size_t i = 0; i < lengths.size(); ++i) {
    assert(lengths[i] == i % 7);
    expected_tokens += i % 7;
  }
  assert(progress.done_items() == 200);
  assert(progress.done_tokens() == expected_tokens);
}

void TestFirstErrorIsRethrown() {
  bool threw = false;
  try {
    ParallelFor(10000, 4, [&](std::size_t i) {
      if (i == 5) {
        throw std::runtime_error("item 5");
      }
    });
  } catch (const std::runtime_error& e) {
    threw = true;
    assert(std::string(e.what()) == "item 5");
  }
  assert(threw);
}

void TestEffectiveThreads() {
  assert(EffectiveThreads(3) == 3);
  assert(EffectiveThreads(0) >= 1);
}

}  // namespace

int main() {
  TestEveryIndexOnce();
  TestPerItemCallbackFeedsProgress();
  TestFirstErrorIsRethrown();
  TestEffectiveThreads();
  return 0;
}
