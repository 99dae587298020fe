#include "rankbpe/vocab.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "rankbpe/errors.hpp"

namespace rankbpe {

namespace {
// Ranks are stored densely for decoding; refuse tables so sparse that the
// inverse vector would dwarf the vocabulary itself.
constexpr std::size_t kMaxSparsity = 16;
}  // namespace

RankTable::RankTable(ByteRankMap ranks) : encoder_(std::move(ranks)) {
  byte_ranks_.fill(kNoRank);
  if (encoder_.empty()) {
    throw VocabularyError("rank table is empty");
  }

  for (const auto& [bytes, rank] : encoder_) {
    if (bytes.empty()) {
      throw VocabularyError("rank table contains an empty byte sequence");
    }
    if (rank == kNoRank) {
      throw VocabularyError("rank " + std::to_string(rank) + " is reserved");
    }
    max_rank_ = std::max(max_rank_, rank);
  }

  if (static_cast<std::size_t>(max_rank_) > kMaxSparsity * encoder_.size() + 256) {
    throw VocabularyError("rank table is too sparse: max rank " + std::to_string(max_rank_) + " for " +
                          std::to_string(encoder_.size()) + " entries");
  }

  decoder_.resize(static_cast<std::size_t>(max_rank_) + 1);
  for (const auto& [bytes, rank] : encoder_) {
    auto& slot = decoder_[rank];
    if (!slot.empty()) {
      throw VocabularyError("rank " + std::to_string(rank) + " is assigned to more than one byte sequence");
    }
    slot = bytes;
    if (bytes.size() == 1) {
      byte_ranks_[static_cast<unsigned char>(bytes[0])] = rank;
    }
  }

  for (std::size_t b = 0; b < byte_ranks_.size(); ++b) {
    if (byte_ranks_[b] == kNoRank) {
      throw VocabularyError("rank table is missing single byte " + std::to_string(b));
    }
  }
}

const std::string* RankTable::BytesOf(Rank rank) const {
  if (rank >= decoder_.size() || decoder_[rank].empty()) {
    return nullptr;
  }
  return &decoder_[rank];
}

SpecialTokenTable::SpecialTokenTable(std::unordered_map<std::string, Rank> tokens)
    : encoder_(tokens.begin(), tokens.end()) {
  decoder_.reserve(encoder_.size());
  for (const auto& [token, rank] : encoder_) {
    if (token.empty()) {
      throw VocabularyError("special token table contains an empty string");
    }
    if (rank == kNoRank) {
      throw VocabularyError("special token " + token + " uses a reserved rank");
    }
    if (!decoder_.emplace(rank, token).second) {
      throw VocabularyError("special rank " + std::to_string(rank) + " is assigned to more than one string");
    }
    max_rank_ = std::max(max_rank_, rank);
  }
}

Rank SpecialTokenTable::Find(std::string_view token) const {
  auto it = encoder_.find(token);
  return it == encoder_.end() ? kNoRank : it->second;
}

const std::string* SpecialTokenTable::StringOf(Rank rank) const {
  auto it = decoder_.find(rank);
  return it == decoder_.end() ? nullptr : &it->second;
}

std::vector<std::string> SpecialTokenTable::Strings() const {
  std::vector<std::string> out;
  out.reserve(encoder_.size());
  for (const auto& kv : encoder_) {
    out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

void ValidateDisjoint(const RankTable& ranks, const SpecialTokenTable& specials) {
  for (const auto& [token, rank] : specials.Map()) {
    if (ranks.BytesOf(rank) != nullptr) {
      throw VocabularyError("special token " + token + " reuses ordinary rank " + std::to_string(rank));
    }
    if (ranks.Contains(token)) {
      throw VocabularyError("special token " + token + " is also an ordinary byte sequence");
    }
  }
}

}  // namespace rankbpe
