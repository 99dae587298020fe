#include <cassert>
#include <future>
#include <string>
#include <vector>

#include "rankbpe/piece_cache.hpp"

using namespace rankbpe;

namespace {

void TestLookupAndFirstInsertWins() {
  PieceCache cache;
  assert(cache.Lookup("hello") == nullptr);
  assert(cache.size() == 0);

  auto first = cache.Insert("hello", {256, 258});
  assert(first && (*first == std::vector<Rank>{256, 258}));

  auto second = cache.Insert("hello", {1, 2, 3});
  assert(second == first);
  assert((*cache.Lookup("hello") == std::vector<Rank>{256, 258}));
  assert(cache.size() == 1);
  assert(cache.max_entries() == 0);
  assert(cache.shard_count() == 16);
}

void TestBoundedShardIsDropped() {
  PieceCache cache(4, 1);
  assert(cache.shard_count() == 1);
  for (int i = 0; i < 4; ++i) {
    cache.Insert("p" + std::to_string(i), {static_cast<Rank>(i)});
  }
  assert(cache.size() == 4);

  auto held = cache.Lookup("p0");
  cache.Insert("p4", {4});
  assert(cache.size() == 1);
  assert(cache.Lookup("p0") == nullptr);
  assert(cache.Lookup("p4") != nullptr);
  // Handed-out entries outlive the shard clear.
  assert((*held == std::vector<Rank>{0}));
}

void TestShardCountCappedByBudget() {
  PieceCache cache(2, 16);
  assert(cache.shard_count() == 2);
  for (int i = 0; i < 100; ++i) {
    cache.Insert("k" + std::to_string(i), {static_cast<Rank>(i)});
    assert(cache.size() <= 2);
  }
}

void TestClear() {
  PieceCache cache(0, 4);
  for (int i = 0; i < 50; ++i) {
    cache.Insert(std::to_string(i), {static_cast<Rank>(i)});
  }
  assert(cache.size() == 50);
  cache.Clear();
  assert(cache.size() == 0);
  assert(cache.Lookup("7") == nullptr);
}

void TestConcurrentInserts() {
  PieceCache cache;
  std::vector<std::future<void>> futures;
  for (int t = 0; t < 8; ++t) {
    futures.push_back(std::async(std::launch::async, [&cache, t] {
      for (int i = 0; i < 500; ++i) {
        const std::string key = "piece" + std::to_string(i);
        auto entry = cache.Insert(key, {static_cast<Rank>(i), static_cast<Rank>(t)});
        assert(entry && (*entry)[0] == static_cast<Rank>(i));
        auto seen = cache.Lookup(key);
        assert(seen == entry);
      }
    }));
  }
  for (auto& f : futures) {
    f.get();
  }
  assert(cache.size() == 500);
}

}  // namespace

int main() {
  TestLookupAndFirstInsertWins();
  TestBoundedShardIsDropped();
  TestShardCountCappedByBudget();
  TestClear();
  TestConcurrentInserts();
  return 0;
}
