#include "rankbpe/encoding.hpp"

#include <algorithm>
#include <utility>

#include <unicode/unistr.h>

#include "rankbpe/byte_pair.hpp"
#include "rankbpe/errors.hpp"
#include "rankbpe/parallel.hpp"

namespace rankbpe {

namespace {

constexpr std::string_view kEndOfText = "<|endoftext|>";

}  // namespace

Encoding::Encoding(std::string name,
                   RankTable ranks,
                   SpecialTokenTable specials,
                   std::string pattern,
                   EncodingOptions options)
    : name_(std::move(name)),
      ranks_(std::move(ranks)),
      specials_(std::move(specials)),
      pretokenizer_(std::move(pattern)),
      matcher_(specials_),
      splitter_(pretokenizer_, matcher_),
      options_(options) {
  ValidateDisjoint(ranks_, specials_);
  if (options_.use_cache) {
    cache_ = std::make_unique<PieceCache>(options_.cache_max_entries, options_.cache_shards);
  }
}

std::size_t Encoding::EncodePiece(std::string_view piece, std::vector<Rank>* out) const {
  // Most pieces are a single token; skip the merge and the cache for those.
  const Rank whole = ranks_.Find(piece);
  if (whole != kNoRank) {
    if (out) {
      out->push_back(whole);
    }
    return 1;
  }

  if (!cache_) {
    auto merged = BytePairEncode(piece, ranks_);
    if (out) {
      out->insert(out->end(), merged.begin(), merged.end());
    }
    return merged.size();
  }

  auto entry = cache_->Lookup(piece);
  if (!entry) {
    entry = cache_->Insert(piece, BytePairEncode(piece, ranks_));
  }
  if (out) {
    out->insert(out->end(), entry->begin(), entry->end());
  }
  return entry->size();
}

std::size_t Encoding::EncodeNative(std::string_view text,
                                   const SpecialSet* allowed,
                                   const SpecialSet* disallowed,
                                   std::vector<Rank>* out) const {
  std::size_t count = 0;
  if (!allowed) {
    pretokenizer_.ForEachPiece(text, [&](std::string_view piece) { count += EncodePiece(piece, out); });
    return count;
  }

  splitter_.ForEachSegment(text, *allowed, *disallowed, [&](const Segment& segment) {
    if (segment.is_special) {
      if (out) {
        out->push_back(segment.special_rank);
      }
      ++count;
    } else {
      count += EncodePiece(segment.text, out);
    }
  });
  return count;
}

std::vector<Rank> Encoding::Encode(std::string_view text, const SpecialSet& allowed, const SpecialSet& disallowed) const {
  std::vector<Rank> out;
  out.reserve(text.size() / 3 + 1);
  EncodeNative(text, &allowed, &disallowed, &out);
  return out;
}

std::vector<Rank> Encoding::EncodeOrdinary(std::string_view text) const {
  std::vector<Rank> out;
  out.reserve(text.size() / 3 + 1);
  EncodeNative(text, nullptr, nullptr, &out);
  return out;
}

std::size_t Encoding::Count(std::string_view text, const SpecialSet& allowed, const SpecialSet& disallowed) const {
  return EncodeNative(text, &allowed, &disallowed, nullptr);
}

std::size_t Encoding::CountOrdinary(std::string_view text) const {
  return EncodeNative(text, nullptr, nullptr, nullptr);
}

std::size_t Encoding::WorkerCount(std::size_t requested, std::size_t jobs) const {
  const std::size_t threads = EffectiveThreads(requested > 0 ? requested : options_.threads);
  return std::min(threads, jobs);
}

std::vector<std::vector<Rank>> Encoding::EncodeBatch(const std::vector<std::string>& texts,
                                                     const SpecialSet& allowed,
                                                     const SpecialSet& disallowed,
                                                     std::size_t threads) const {
  std::vector<std::vector<Rank>> out(texts.size());
  ParallelFor(texts.size(), WorkerCount(threads, texts.size()),
              [&](std::size_t i) { out[i] = Encode(texts[i], allowed, disallowed); });
  return out;
}

std::vector<std::vector<Rank>> Encoding::EncodeOrdinaryBatch(const std::vector<std::string>& texts,
                                                             std::size_t threads) const {
  std::vector<std::vector<Rank>> out(texts.size());
  ParallelFor(texts.size(), WorkerCount(threads, texts.size()),
              [&](std::size_t i) { out[i] = EncodeOrdinary(texts[i]); });
  return out;
}

void Encoding::AppendBytes(Rank token, std::string& out) const {
  if (const std::string* bytes = ranks_.BytesOf(token)) {
    out += *bytes;
    return;
  }
  if (const std::string* special = specials_.StringOf(token)) {
    out += *special;
    return;
  }
  throw UnknownToken(token);
}

std::string Encoding::Decode(const std::vector<Rank>& tokens) const {
  std::string out;
  out.reserve(tokens.size() * 4);
  for (Rank token : tokens) {
    AppendBytes(token, out);
  }
  return out;
}

std::string Encoding::DecodeLossy(const std::vector<Rank>& tokens) const {
  const std::string bytes = Decode(tokens);
  // ICU substitutes U+FFFD for each maximal ill-formed subsequence.
  std::string out;
  icu::UnicodeString::fromUTF8(bytes).toUTF8String(out);
  return out;
}

std::vector<std::string> Encoding::DecodeBatch(const std::vector<std::vector<Rank>>& batch, std::size_t threads) const {
  std::vector<std::string> out(batch.size());
  ParallelFor(batch.size(), WorkerCount(threads, batch.size()), [&](std::size_t i) { out[i] = Decode(batch[i]); });
  return out;
}

std::string Encoding::DecodeSingleTokenBytes(Rank token) const {
  std::string out;
  AppendBytes(token, out);
  return out;
}

Rank Encoding::EncodeSingleToken(std::string_view bytes) const {
  Rank token = ranks_.Find(bytes);
  if (token == kNoRank) {
    token = specials_.Find(bytes);
  }
  if (token == kNoRank) {
    throw EncodingError("byte sequence of length " + std::to_string(bytes.size()) + " is not a single token in " +
                        name_);
  }
  return token;
}

Rank Encoding::MaxTokenValue() const {
  if (specials_.empty()) {
    return ranks_.MaxRank();
  }
  return std::max(ranks_.MaxRank(), specials_.MaxRank());
}

std::optional<Rank> Encoding::EotToken() const {
  const Rank token = specials_.Find(kEndOfText);
  if (token == kNoRank) {
    return std::nullopt;
  }
  return token;
}

std::vector<std::string> Encoding::TokenByteValues() const {
  std::vector<std::string> out;
  out.reserve(ranks_.size());
  for (Rank rank = 0; rank <= ranks_.MaxRank(); ++rank) {
    if (const std::string* bytes = ranks_.BytesOf(rank)) {
      out.push_back(*bytes);
    }
  }
  return out;
}

void Encoding::ClearCache() const {
  if (cache_) {
    cache_->Clear();
  }
}

}  // namespace rankbpe
