#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rankbpe/piece_cache.hpp"
#include "rankbpe/pretokenizer.hpp"
#include "rankbpe/vocab.hpp"

namespace rankbpe {

struct EncodingOptions {
  bool use_cache = true;
  // 0 = unbounded.
  std::size_t cache_max_entries = 0;
  std::size_t cache_shards = 16;
  // Default worker count for the batch calls; 0 = hardware concurrency.
  std::size_t threads = 0;
};

// A complete tokenization scheme: rank table, special tokens and split rule.
//
// Everything but the piece cache is immutable after construction, and the
// cache is internally synchronized, so one Encoding can be shared freely
// between threads. Construction validates that ordinary and special ranks are
// disjoint and throws VocabularyError or PatternError otherwise.
class Encoding {
 public:
  Encoding(std::string name,
           RankTable ranks,
           SpecialTokenTable specials,
           std::string pattern,
           EncodingOptions options = {});

  Encoding(const Encoding&) = delete;
  Encoding& operator=(const Encoding&) = delete;

  // Special tokens in `allowed` become their reserved rank; any other special
  // token in `disallowed` throws DisallowedSpecialToken. The defaults reject
  // every special token that appears in the text.
  [[nodiscard]] std::vector<Rank> Encode(std::string_view text,
                                         const SpecialSet& allowed = SpecialSet::None(),
                                         const SpecialSet& disallowed = SpecialSet::All()) const;

  // Treats special-token strings as plain text.
  [[nodiscard]] std::vector<Rank> EncodeOrdinary(std::string_view text) const;

  // threads == 0 falls back to the configured default.
  [[nodiscard]] std::vector<std::vector<Rank>> EncodeBatch(const std::vector<std::string>& texts,
                                                           const SpecialSet& allowed = SpecialSet::None(),
                                                           const SpecialSet& disallowed = SpecialSet::All(),
                                                           std::size_t threads = 0) const;
  [[nodiscard]] std::vector<std::vector<Rank>> EncodeOrdinaryBatch(const std::vector<std::string>& texts,
                                                                   std::size_t threads = 0) const;

  // Exact bytes; throws UnknownToken for ids outside both tables.
  [[nodiscard]] std::string Decode(const std::vector<Rank>& tokens) const;
  // As Decode, with ill-formed UTF-8 replaced by U+FFFD.
  [[nodiscard]] std::string DecodeLossy(const std::vector<Rank>& tokens) const;
  [[nodiscard]] std::vector<std::string> DecodeBatch(const std::vector<std::vector<Rank>>& batch,
                                                     std::size_t threads = 0) const;

  [[nodiscard]] std::string DecodeSingleTokenBytes(Rank token) const;
  // Throws EncodingError unless `bytes` is exactly one ordinary or special token.
  [[nodiscard]] Rank EncodeSingleToken(std::string_view bytes) const;

  [[nodiscard]] std::size_t Count(std::string_view text,
                                  const SpecialSet& allowed = SpecialSet::None(),
                                  const SpecialSet& disallowed = SpecialSet::All()) const;
  [[nodiscard]] std::size_t CountOrdinary(std::string_view text) const;

  [[nodiscard]] const std::string& Name() const { return name_; }
  [[nodiscard]] std::vector<std::string> SpecialTokens() const { return specials_.Strings(); }
  [[nodiscard]] bool IsSpecialToken(Rank token) const { return specials_.StringOf(token) != nullptr; }
  [[nodiscard]] Rank MaxTokenValue() const;
  [[nodiscard]] std::size_t VocabSize() const { return static_cast<std::size_t>(MaxTokenValue()) + 1; }
  [[nodiscard]] std::optional<Rank> EotToken() const;
  // Ordinary token bytes in rank order.
  [[nodiscard]] std::vector<std::string> TokenByteValues() const;

  [[nodiscard]] std::size_t CacheSize() const { return cache_ ? cache_->size() : 0; }
  void ClearCache() const;

  [[nodiscard]] const RankTable& ranks() const { return ranks_; }
  [[nodiscard]] const SpecialTokenTable& specials() const { return specials_; }
  [[nodiscard]] const std::string& pattern() const { return pretokenizer_.pattern(); }
  [[nodiscard]] const EncodingOptions& options() const { return options_; }

 private:
  // Shared by Encode and Count. A null `allowed` means ordinary-only
  // encoding; a null `out` only counts.
  std::size_t EncodeNative(std::string_view text,
                           const SpecialSet* allowed,
                           const SpecialSet* disallowed,
                           std::vector<Rank>* out) const;
  std::size_t EncodePiece(std::string_view piece, std::vector<Rank>* out) const;
  void AppendBytes(Rank token, std::string& out) const;
  std::size_t WorkerCount(std::size_t requested, std::size_t jobs) const;

  std::string name_;
  RankTable ranks_;
  SpecialTokenTable specials_;
  PreTokenizer pretokenizer_;
  SpecialTokenMatcher matcher_;
  Splitter splitter_;
  EncodingOptions options_;
  std::unique_ptr<PieceCache> cache_;
};

}  // namespace rankbpe
