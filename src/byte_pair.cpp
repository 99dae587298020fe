#include "rankbpe/byte_pair.hpp"

#include <queue>
#include <string>
#include <tuple>
#include <utility>

#include "rankbpe/errors.hpp"

namespace rankbpe {

namespace {

std::vector<std::size_t> TrivialBoundaries(std::size_t n) {
  if (n == 0) {
    return {};
  }
  return {0, n};
}

// Candidate merge of the parts [start, mid) and [mid, end).
struct PairCandidate {
  Rank rank;
  std::size_t start;
  std::size_t mid;
  std::size_t end;
};

struct PairCandidateOrder {
  // Min-queue on rank, then on start offset.
  bool operator()(const PairCandidate& l, const PairCandidate& r) const {
    return std::tie(l.rank, l.start) > std::tie(r.rank, r.start);
  }
};

}  // namespace

std::vector<std::size_t> BytePairMerge(std::string_view piece, const RankTable& ranks) {
  const std::size_t n = piece.size();
  if (n < 2) {
    return TrivialBoundaries(n);
  }

  // (start offset, rank of the pair beginning at this part). The two trailing
  // entries are sentinels so that parts[i + 3] always exists for a real pair.
  std::vector<std::pair<std::size_t, Rank>> parts;
  parts.reserve(n + 1);

  Rank min_rank = kNoRank;
  std::size_t min_idx = 0;
  for (std::size_t i = 0; i + 1 < n; ++i) {
    const Rank rank = ranks.Find(piece.substr(i, 2));
    if (rank < min_rank) {
      min_rank = rank;
      min_idx = i;
    }
    parts.emplace_back(i, rank);
  }
  parts.emplace_back(n - 1, kNoRank);
  parts.emplace_back(n, kNoRank);

  auto pair_rank = [&](std::size_t i) -> Rank {
    if (i + 3 >= parts.size()) {
      return kNoRank;
    }
    const std::size_t start = parts[i].first;
    return ranks.Find(piece.substr(start, parts[i + 3].first - start));
  };

  while (min_rank != kNoRank) {
    const std::size_t i = min_idx;
    // Recompute before erasing: parts[i + 1] disappears and both the merged
    // part and its left neighbour get a new right-hand pair.
    if (i > 0) {
      parts[i - 1].second = pair_rank(i - 1);
    }
    parts[i].second = pair_rank(i);
    parts.erase(parts.begin() + static_cast<std::ptrdiff_t>(i + 1));

    min_rank = kNoRank;
    for (std::size_t j = 0; j + 1 < parts.size(); ++j) {
      if (parts[j].second < min_rank) {
        min_rank = parts[j].second;
        min_idx = j;
      }
    }
  }

  std::vector<std::size_t> bounds;
  bounds.reserve(parts.size() - 1);
  for (std::size_t j = 0; j + 1 < parts.size(); ++j) {
    bounds.push_back(parts[j].first);
  }
  bounds.push_back(n);
  return bounds;
}

std::vector<std::size_t> BytePairMergeHeap(std::string_view piece, const RankTable& ranks) {
  const std::size_t n = piece.size();
  if (n < 2) {
    return TrivialBoundaries(n);
  }

  // Doubly linked list over part start offsets; n is the end sentinel.
  std::vector<std::size_t> next(n + 1);
  std::vector<std::size_t> prev(n + 1);
  std::vector<bool> alive(n + 1, true);
  for (std::size_t i = 0; i <= n; ++i) {
    next[i] = i + 1;
    prev[i] = i == 0 ? 0 : i - 1;
  }

  std::priority_queue<PairCandidate, std::vector<PairCandidate>, PairCandidateOrder> queue;
  auto push = [&](std::size_t start, std::size_t mid, std::size_t end) {
    const Rank rank = ranks.Find(piece.substr(start, end - start));
    if (rank != kNoRank) {
      queue.push({rank, start, mid, end});
    }
  };

  for (std::size_t i = 0; i + 1 < n; ++i) {
    push(i, i + 1, i + 2);
  }

  while (!queue.empty()) {
    const PairCandidate top = queue.top();
    queue.pop();
    // Stale unless the three boundaries are still consecutive.
    if (!alive[top.start] || !alive[top.mid] || next[top.start] != top.mid || next[top.mid] != top.end) {
      continue;
    }

    alive[top.mid] = false;
    next[top.start] = top.end;
    prev[top.end] = top.start;

    if (top.start > 0) {
      push(prev[top.start], top.start, top.end);
    }
    if (top.end < n) {
      push(top.start, top.end, next[top.end]);
    }
  }

  std::vector<std::size_t> bounds;
  for (std::size_t i = 0; i < n; i = next[i]) {
    bounds.push_back(i);
  }
  bounds.push_back(n);
  return bounds;
}

std::vector<Rank> BytePairEncode(std::string_view piece, const RankTable& ranks) {
  if (piece.size() == 1) {
    return {ranks.ByteRank(static_cast<unsigned char>(piece[0]))};
  }

  const auto bounds =
      piece.size() >= kHeapMergeThreshold ? BytePairMergeHeap(piece, ranks) : BytePairMerge(piece, ranks);

  std::vector<Rank> out;
  if (bounds.empty()) {
    return out;
  }
  out.reserve(bounds.size() - 1);
  for (std::size_t k = 0; k + 1 < bounds.size(); ++k) {
    const Rank rank = ranks.Find(piece.substr(bounds[k], bounds[k + 1] - bounds[k]));
    if (rank == kNoRank) {
      throw InvariantViolation("merged span [" + std::to_string(bounds[k]) + ", " + std::to_string(bounds[k + 1]) +
                               ") of a " + std::to_string(piece.size()) + "-byte piece has no rank");
    }
    out.push_back(rank);
  }
  return out;
}

std::vector<std::string_view> BytePairSplit(std::string_view piece, const RankTable& ranks) {
  const auto bounds =
      piece.size() >= kHeapMergeThreshold ? BytePairMergeHeap(piece, ranks) : BytePairMerge(piece, ranks);

  std::vector<std::string_view> out;
  if (bounds.empty()) {
    return out;
  }
  out.reserve(bounds.size() - 1);
  for (std::size_t k = 0; k + 1 < bounds.size(); ++k) {
    out.push_back(piece.substr(bounds[k], bounds[k + 1] - bounds[k]));
  }
  return out;
}

}  // namespace rankbpe
