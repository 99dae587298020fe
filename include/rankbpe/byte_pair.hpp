#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "rankbpe/vocab.hpp"

namespace rankbpe {

// Pieces at least this long are merged with the priority-queue variant.
inline constexpr std::size_t kHeapMergeThreshold = 128;

// Greedy byte-pair merge of one piece. Returns the start offset of every
// final part followed by piece.size(), so part k is [b[k], b[k + 1]).
//
// At each step the adjacent pair with the lowest rank is merged; among equal
// ranks the leftmost pair wins. Both functions produce identical boundaries:
// BytePairMerge re-scans the parts list each step, BytePairMergeHeap keeps
// candidate pairs in a queue ordered by (rank, start offset).
[[nodiscard]] std::vector<std::size_t> BytePairMerge(std::string_view piece, const RankTable& ranks);
[[nodiscard]] std::vector<std::size_t> BytePairMergeHeap(std::string_view piece, const RankTable& ranks);

// Ranks of the final parts. Throws InvariantViolation if a part is missing
// from the table, which a validated table makes impossible.
[[nodiscard]] std::vector<Rank> BytePairEncode(std::string_view piece, const RankTable& ranks);

// The final parts as views into `piece`.
[[nodiscard]] std::vector<std::string_view> BytePairSplit(std::string_view piece, const RankTable& ranks);

}  // namespace rankbpe
