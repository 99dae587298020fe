#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rankbpe {

using Rank = std::uint32_t;

inline constexpr Rank kNoRank = std::numeric_limits<Rank>::max();

// Lets string-keyed maps be probed with a std::string_view without a copy.
struct StringHash {
  using is_transparent = void;

  std::size_t operator()(std::string_view s) const noexcept { return std::hash<std::string_view>{}(s); }
  std::size_t operator()(const std::string& s) const noexcept { return std::hash<std::string_view>{}(s); }
};

using ByteRankMap = std::unordered_map<std::string, Rank, StringHash, std::equal_to<>>;

// Immutable bytes <-> rank mapping of the mergeable vocabulary.
//
// Construction rejects (VocabularyError) empty keys, ranks used twice and
// tables that miss any of the 256 single-byte sequences, so the merge engine
// always has a base case.
class RankTable {
 public:
  explicit RankTable(ByteRankMap ranks);

  [[nodiscard]] Rank Find(std::string_view bytes) const {
    auto it = encoder_.find(bytes);
    return it == encoder_.end() ? kNoRank : it->second;
  }
  [[nodiscard]] bool Contains(std::string_view bytes) const { return encoder_.find(bytes) != encoder_.end(); }
  [[nodiscard]] Rank ByteRank(unsigned char b) const { return byte_ranks_[b]; }

  // nullptr when the rank is not ordinary.
  [[nodiscard]] const std::string* BytesOf(Rank rank) const;

  [[nodiscard]] std::size_t size() const { return encoder_.size(); }
  [[nodiscard]] Rank MaxRank() const { return max_rank_; }

 private:
  ByteRankMap encoder_;
  std::vector<std::string> decoder_;
  std::array<Rank, 256> byte_ranks_{};
  Rank max_rank_ = 0;
};

// Immutable literal string <-> reserved rank mapping.
class SpecialTokenTable {
 public:
  SpecialTokenTable() = default;
  explicit SpecialTokenTable(std::unordered_map<std::string, Rank> tokens);

  [[nodiscard]] Rank Find(std::string_view token) const;
  [[nodiscard]] const std::string* StringOf(Rank rank) const;

  [[nodiscard]] bool empty() const { return encoder_.empty(); }
  [[nodiscard]] std::size_t size() const { return encoder_.size(); }
  [[nodiscard]] Rank MaxRank() const { return max_rank_; }
  [[nodiscard]] const ByteRankMap& Map() const { return encoder_; }

  // Sorted, for stable listings.
  [[nodiscard]] std::vector<std::string> Strings() const;

 private:
  ByteRankMap encoder_;
  std::unordered_map<Rank, std::string> decoder_;
  Rank max_rank_ = 0;
};

// Throws VocabularyError if a special rank is also an ordinary rank or a
// special string is also an ordinary byte sequence. Special ranks normally
// sit above the ordinary range; p50k keeps <|endoftext|> in a hole inside it.
void ValidateDisjoint(const RankTable& ranks, const SpecialTokenTable& specials);

}  // namespace rankbpe
