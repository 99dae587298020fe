#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rankbpe/vocab.hpp"

namespace rankbpe {

// Concurrent memo from piece bytes to the ranks the merge engine produced.
//
// Entries are immutable once published and handed out as shared pointers, so
// a reader never sees a partially written value and keeps its entry alive
// even if the shard is cleared meanwhile. Keys are spread over shards with
// their own reader/writer lock; unrelated pieces rarely contend. Two threads
// missing on the same piece may both compute it; the first insert wins.
//
// max_entries == 0 means unbounded. Otherwise a shard that reaches its share
// of the budget is dropped wholesale before the next insert.
class PieceCache {
 public:
  using Entry = std::shared_ptr<const std::vector<Rank>>;

  explicit PieceCache(std::size_t max_entries = 0, std::size_t shard_count = 16);

  PieceCache(const PieceCache&) = delete;
  PieceCache& operator=(const PieceCache&) = delete;

  [[nodiscard]] Entry Lookup(std::string_view piece) const;

  // Insert-if-absent. Returns the entry that is in the cache afterwards.
  Entry Insert(std::string_view piece, std::vector<Rank> ranks);

  void Clear();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t max_entries() const { return max_entries_; }
  [[nodiscard]] std::size_t shard_count() const { return shards_.size(); }

 private:
  struct Shard {
    mutable std::shared_mutex mu;
    std::unordered_map<std::string, Entry, StringHash, std::equal_to<>> map;
  };

  [[nodiscard]] Shard& ShardFor(std::string_view piece) const;

  std::vector<std::unique_ptr<Shard>> shards_;
  std::size_t max_entries_;
  std::size_t shard_budget_;
};

}  // namespace rankbpe
