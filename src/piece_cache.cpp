#include "rankbpe/piece_cache.hpp"

#include <algorithm>
#include <functional>
#include <mutex>
#include <utility>

namespace rankbpe {

PieceCache::PieceCache(std::size_t max_entries, std::size_t shard_count) : max_entries_(max_entries) {
  shard_count = std::max<std::size_t>(shard_count, 1);
  if (max_entries_ > 0) {
    shard_count = std::min(shard_count, max_entries_);
  }
  shards_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
  shard_budget_ = max_entries_ == 0 ? 0 : std::max<std::size_t>(max_entries_ / shard_count, 1);
}

PieceCache::Shard& PieceCache::ShardFor(std::string_view piece) const {
  const std::size_t h = std::hash<std::string_view>{}(piece);
  // The shard map hashes the same key again; use the high bits here.
  return *shards_[(h >> 17) % shards_.size()];
}

PieceCache::Entry PieceCache::Lookup(std::string_view piece) const {
  Shard& shard = ShardFor(piece);
  std::shared_lock<std::shared_mutex> lock(shard.mu);
  auto it = shard.map.find(piece);
  return it == shard.map.end() ? nullptr : it->second;
}

PieceCache::Entry PieceCache::Insert(std::string_view piece, std::vector<Rank> ranks) {
  auto entry = std::make_shared<const std::vector<Rank>>(std::move(ranks));
  Shard& shard = ShardFor(piece);
  std::unique_lock<std::shared_mutex> lock(shard.mu);
  auto it = shard.map.find(piece);
  if (it != shard.map.end()) {
    return it->second;
  }
  if (shard_budget_ > 0 && shard.map.size() >= shard_budget_) {
    shard.map.clear();
  }
  shard.map.emplace(std::string(piece), entry);
  return entry;
}

void PieceCache::Clear() {
  for (auto& shard : shards_) {
    std::unique_lock<std::shared_mutex> lock(shard->mu);
    shard->map.clear();
  }
}

std::size_t PieceCache::size() const {
  std::size_t total = 0;
  for (const auto& shard : shards_) {
    std::shared_lock<std::shared_mutex> lock(shard->mu);
    total += shard->map.size();
  }
  return total;
}

}  // namespace rankbpe
