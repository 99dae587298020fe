#include "rankbpe/pretokenizer.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>

#include <unicode/regex.h>
#include <unicode/unistr.h>
#include <unicode/utext.h>

#include "rankbpe/errors.hpp"

namespace rankbpe {

namespace {

struct UTextCloser {
  void operator()(UText* ut) const { utext_close(ut); }
};

using UTextPtr = std::unique_ptr<UText, UTextCloser>;

std::string StatusMessage(const char* what, UErrorCode status) {
  return std::string(what) + ": " + u_errorName(status);
}

}  // namespace

struct PreTokenizer::CompiledPattern {
  std::unique_ptr<icu::RegexPattern> regex;
};

PreTokenizer::PreTokenizer(std::string pattern)
    : pattern_(std::move(pattern)), compiled_(std::make_unique<CompiledPattern>()) {
  UErrorCode status = U_ZERO_ERROR;
  UParseError parse_error{};
  icu::UnicodeString pattern_u = icu::UnicodeString::fromUTF8(pattern_);
  compiled_->regex.reset(icu::RegexPattern::compile(pattern_u, 0, parse_error, status));
  if (U_FAILURE(status) || !compiled_->regex) {
    throw PatternError(StatusMessage("failed to compile split pattern", status) + " at offset " +
                       std::to_string(parse_error.offset));
  }
}

PreTokenizer::~PreTokenizer() = default;

void PreTokenizer::ForEachPiece(std::string_view text, const std::function<void(std::string_view)>& fn) const {
  if (text.empty()) {
    return;
  }

  UErrorCode status = U_ZERO_ERROR;
  UTextPtr input(utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status));
  if (U_FAILURE(status)) {
    throw PatternError(StatusMessage("failed to open text", status));
  }
  std::unique_ptr<icu::RegexMatcher> matcher(compiled_->regex->matcher(status));
  if (U_FAILURE(status) || !matcher) {
    throw PatternError(StatusMessage("failed to create matcher", status));
  }
  // The possessive runs in the cl100k rule grow the backtrack stack with the
  // run length; the default 8 MB cap fails on a few hundred KB of letters.
  matcher->setStackLimit(0, status);
  if (U_FAILURE(status)) {
    throw PatternError(StatusMessage("failed to lift matcher stack limit", status));
  }
  matcher->reset(input.get());

  // Offsets reported by a UTF-8 UText are byte offsets into `text`.
  std::size_t cursor = 0;
  while (matcher->find(status)) {
    const auto start = static_cast<std::size_t>(matcher->start64(status));
    const auto end = static_cast<std::size_t>(matcher->end64(status));
    if (U_FAILURE(status)) {
      throw PatternError(StatusMessage("match offsets unavailable", status));
    }
    if (start > cursor) {
      fn(text.substr(cursor, start - cursor));
    }
    if (end > start) {
      fn(text.substr(start, end - start));
    }
    cursor = std::max(cursor, end);
  }
  if (U_FAILURE(status)) {
    throw PatternError(StatusMessage("split failed", status));
  }
  if (cursor < text.size()) {
    fn(text.substr(cursor));
  }
}

std::vector<std::string_view> PreTokenizer::Split(std::string_view text) const {
  std::vector<std::string_view> pieces;
  ForEachPiece(text, [&](std::string_view piece) { pieces.push_back(piece); });
  return pieces;
}

SpecialSet::SpecialSet(std::initializer_list<std::string> tokens) : tokens_(tokens.begin(), tokens.end()) {}

SpecialSet::SpecialSet(std::unordered_set<std::string> tokens) {
  tokens_.reserve(tokens.size());
  for (auto& token : tokens) {
    tokens_.insert(token);
  }
}

SpecialSet SpecialSet::All() {
  SpecialSet set;
  set.all_ = true;
  return set;
}

bool SpecialSet::Contains(std::string_view token) const {
  return all_ || tokens_.find(token) != tokens_.end();
}

SpecialTokenMatcher::SpecialTokenMatcher(const SpecialTokenTable& table) {
  for (const auto& [token, rank] : table.Map()) {
    by_first_byte_[static_cast<unsigned char>(token[0])].emplace_back(token, rank);
    ++count_;
  }
  for (auto& bucket : by_first_byte_) {
    std::sort(bucket.begin(), bucket.end(), [](const auto& l, const auto& r) {
      return l.first.size() != r.first.size() ? l.first.size() > r.first.size() : l.first < r.first;
    });
  }
}

std::optional<SpecialMatch> SpecialTokenMatcher::FindNext(std::string_view text,
                                                          std::size_t from,
                                                          const SpecialSet& allowed,
                                                          const SpecialSet& disallowed) const {
  if (count_ == 0 || (allowed.empty() && disallowed.empty())) {
    return std::nullopt;
  }

  for (std::size_t pos = from; pos < text.size(); ++pos) {
    const auto& bucket = by_first_byte_[static_cast<unsigned char>(text[pos])];
    if (bucket.empty()) {
      continue;
    }
    const std::size_t remaining = text.size() - pos;
    for (const auto& [token, rank] : bucket) {
      if (token.size() > remaining || std::memcmp(text.data() + pos, token.data(), token.size()) != 0) {
        continue;
      }
      if (allowed.Contains(token)) {
        return SpecialMatch{pos, token.size(), rank};
      }
      if (disallowed.Contains(token)) {
        throw DisallowedSpecialToken(token, pos);
      }
    }
  }
  return std::nullopt;
}

void Splitter::ForEachSegment(std::string_view text,
                              const SpecialSet& allowed,
                              const SpecialSet& disallowed,
                              const std::function<void(const Segment&)>& fn) const {
  auto emit_ordinary = [&](std::string_view span) {
    pretokenizer_.ForEachPiece(span, [&](std::string_view piece) {
      fn(Segment{piece, static_cast<std::size_t>(piece.data() - text.data()), false, kNoRank});
    });
  };

  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto match = specials_.FindNext(text, pos, allowed, disallowed);
    const std::size_t ordinary_end = match ? match->offset : text.size();
    if (ordinary_end > pos) {
      emit_ordinary(text.substr(pos, ordinary_end - pos));
    }
    if (!match) {
      break;
    }
    fn(Segment{text.substr(match->offset, match->length), match->offset, true, match->rank});
    pos = match->offset + match->length;
  }
}

std::vector<Segment> Splitter::Split(std::string_view text,
                                     const SpecialSet& allowed,
                                     const SpecialSet& disallowed) const {
  std::vector<Segment> segments;
  ForEachSegment(text, allowed, disallowed, [&](const Segment& segment) { segments.push_back(segment); });
  return segments;
}

}  // namespace rankbpe
