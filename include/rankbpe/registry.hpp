#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rankbpe/config.hpp"
#include "rankbpe/encoding.hpp"

namespace rankbpe {

// Split rules of the published schemes, in ICU syntax. \s and \S are spelled
// as White_Space properties so that \x0B and \x85 count as whitespace.
extern const char* const kR50kPattern;
extern const char* const kCl100kPattern;
extern const char* const kO200kPattern;

enum class VocabFormat {
  tiktoken,
  data_gym,
};

struct SchemeSpec {
  std::string name;
  std::string pattern;
  std::unordered_map<std::string, Rank> special_tokens;
  // Published vocabulary size, checked after loading.
  std::optional<std::size_t> explicit_n_vocab;
  VocabFormat format = VocabFormat::tiktoken;
  // File names relative to the vocabulary directory. For data_gym, `file`
  // is vocab.bpe and `aux_file` is encoder.json.
  std::string file;
  std::string aux_file;
};

[[nodiscard]] const std::vector<SchemeSpec>& Schemes();
// nullptr when unknown.
[[nodiscard]] const SchemeSpec* FindScheme(std::string_view name);
[[nodiscard]] std::vector<std::string> ListEncodingNames();

// Loads the scheme's vocabulary from `vocab_dir` and builds a fresh Encoding.
// A missing "<file>" falls back to "<file>.gz".
[[nodiscard]] std::unique_ptr<Encoding> BuildEncoding(const SchemeSpec& spec,
                                                      const std::string& vocab_dir,
                                                      const EncodingOptions& options = {});

// Process-wide instances, built on first use per vocab_dir, name and the
// encoding options derived from `cfg` (cache size, threads).
// Throws UnknownEncoding for names not in Schemes().
[[nodiscard]] std::shared_ptr<const Encoding> GetEncoding(const std::string& name, const Config& cfg = Config{});

}  // namespace rankbpe
