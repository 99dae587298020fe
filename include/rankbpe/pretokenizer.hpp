#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "rankbpe/vocab.hpp"

namespace rankbpe {

// Splits ordinary text into pieces with a scheme's segmentation pattern.
//
// The pattern is compiled once with ICU and shared read-only; every Split
// call creates its own matcher, so one PreTokenizer serves many threads.
// Matching runs directly over the UTF-8 bytes, pieces are views into the
// input, and bytes that no match covers (only possible for ill-formed UTF-8)
// become pieces of their own. The pieces always tile the input exactly.
class PreTokenizer {
 public:
  explicit PreTokenizer(std::string pattern);
  ~PreTokenizer();

  PreTokenizer(const PreTokenizer&) = delete;
  PreTokenizer& operator=(const PreTokenizer&) = delete;

  void ForEachPiece(std::string_view text, const std::function<void(std::string_view)>& fn) const;
  [[nodiscard]] std::vector<std::string_view> Split(std::string_view text) const;

  [[nodiscard]] const std::string& pattern() const { return pattern_; }

 private:
  struct CompiledPattern;

  std::string pattern_;
  std::unique_ptr<CompiledPattern> compiled_;
};

// A set of special-token strings, or the symbolic "every special token".
class SpecialSet {
 public:
  SpecialSet() = default;
  SpecialSet(std::initializer_list<std::string> tokens);
  explicit SpecialSet(std::unordered_set<std::string> tokens);

  static SpecialSet All();
  static SpecialSet None() { return SpecialSet(); }

  [[nodiscard]] bool Contains(std::string_view token) const;
  [[nodiscard]] bool IsAll() const { return all_; }
  [[nodiscard]] bool empty() const { return !all_ && tokens_.empty(); }

 private:
  bool all_ = false;
  std::unordered_set<std::string, StringHash, std::equal_to<>> tokens_;
};

struct SpecialMatch {
  std::size_t offset = 0;
  std::size_t length = 0;
  Rank rank = kNoRank;
};

// Literal scanner for special tokens. At every position the longest special
// string that is allowed or disallowed decides: allowed ones are returned,
// disallowed ones raise DisallowedSpecialToken. Strings in neither set are
// ordinary text. Membership in `allowed` wins over `disallowed`.
class SpecialTokenMatcher {
 public:
  explicit SpecialTokenMatcher(const SpecialTokenTable& table);

  [[nodiscard]] std::optional<SpecialMatch> FindNext(std::string_view text,
                                                     std::size_t from,
                                                     const SpecialSet& allowed,
                                                     const SpecialSet& disallowed) const;

  [[nodiscard]] bool empty() const { return count_ == 0; }

 private:
  // Candidates bucketed by first byte, longest first.
  std::array<std::vector<std::pair<std::string, Rank>>, 256> by_first_byte_;
  std::size_t count_ = 0;
};

struct Segment {
  std::string_view text;
  std::size_t offset = 0;
  bool is_special = false;
  Rank special_rank = kNoRank;
};

// Special-token interception followed by pattern splitting of the ordinary
// text in between. Segments come out in text order and tile the input.
class Splitter {
 public:
  Splitter(const PreTokenizer& pretokenizer, const SpecialTokenMatcher& specials)
      : pretokenizer_(pretokenizer), specials_(specials) {}

  void ForEachSegment(std::string_view text,
                      const SpecialSet& allowed,
                      const SpecialSet& disallowed,
                      const std::function<void(const Segment&)>& fn) const;

  [[nodiscard]] std::vector<Segment> Split(std::string_view text,
                                           const SpecialSet& allowed,
                                           const SpecialSet& disallowed) const;

 private:
  const PreTokenizer& pretokenizer_;
  const SpecialTokenMatcher& specials_;
};

}  // namespace rankbpe
