#include "rankbpe/registry.hpp"

#include <filesystem>
#include <mutex>
#include <utility>

#include "rankbpe/errors.hpp"
#include "rankbpe/load.hpp"

namespace rankbpe {

const char* const kR50kPattern =
    R"('(?:[sdmt]|ll|ve|re)| ?\p{L}+| ?\p{N}+| ?[^\p{White_Space}\p{L}\p{N}]+)"
    R"(|\p{White_Space}+(?!\P{White_Space})|\p{White_Space}+)";

// \z rather than $: ICU's $ also matches before a trailing line terminator.
const char* const kCl100kPattern =
    R"('(?i:[sdmt]|ll|ve|re)|[^\r\n\p{L}\p{N}]?+\p{L}++|\p{N}{1,3}+)"
    R"(| ?[^\p{White_Space}\p{L}\p{N}]++[\r\n]*+|\p{White_Space}++\z|\p{White_Space}*[\r\n])"
    R"(|\p{White_Space}+(?!\P{White_Space})|\p{White_Space})";

const char* const kO200kPattern =
    R"([^\r\n\p{L}\p{N}]?[\p{Lu}\p{Lt}\p{Lm}\p{Lo}\p{M}]*[\p{Ll}\p{Lm}\p{Lo}\p{M}]+(?i:'s|'t|'re|'ve|'m|'ll|'d)?)"
    R"(|[^\r\n\p{L}\p{N}]?[\p{Lu}\p{Lt}\p{Lm}\p{Lo}\p{M}]+[\p{Ll}\p{Lm}\p{Lo}\p{M}]*(?i:'s|'t|'re|'ve|'m|'ll|'d)?)"
    R"(|\p{N}{1,3}| ?[^\p{White_Space}\p{L}\p{N}]+[\r\n/]*|\p{White_Space}*[\r\n]+)"
    R"(|\p{White_Space}+(?!\P{White_Space})|\p{White_Space}+)";

namespace {

constexpr const char* kEndOfText = "<|endoftext|>";
constexpr const char* kFimPrefix = "<|fim_prefix|>";
constexpr const char* kFimMiddle = "<|fim_middle|>";
constexpr const char* kFimSuffix = "<|fim_suffix|>";
constexpr const char* kEndOfPrompt = "<|endofprompt|>";

std::vector<SchemeSpec> BuildSchemes() {
  std::vector<SchemeSpec> schemes;

  SchemeSpec gpt2;
  gpt2.name = "gpt2";
  gpt2.pattern = kR50kPattern;
  gpt2.special_tokens = {{kEndOfText, 50256}};
  gpt2.explicit_n_vocab = 50257;
  gpt2.format = VocabFormat::data_gym;
  gpt2.file = "vocab.bpe";
  gpt2.aux_file = "encoder.json";
  schemes.push_back(std::move(gpt2));

  SchemeSpec r50k;
  r50k.name = "r50k_base";
  r50k.pattern = kR50kPattern;
  r50k.special_tokens = {{kEndOfText, 50256}};
  r50k.explicit_n_vocab = 50257;
  r50k.file = "r50k_base.tiktoken";
  schemes.push_back(std::move(r50k));

  SchemeSpec p50k;
  p50k.name = "p50k_base";
  p50k.pattern = kR50kPattern;
  p50k.special_tokens = {{kEndOfText, 50256}};
  p50k.explicit_n_vocab = 50281;
  p50k.file = "p50k_base.tiktoken";
  schemes.push_back(std::move(p50k));

  SchemeSpec p50k_edit;
  p50k_edit.name = "p50k_edit";
  p50k_edit.pattern = kR50kPattern;
  p50k_edit.special_tokens = {{kEndOfText, 50256}, {kFimPrefix, 50281}, {kFimMiddle, 50282}, {kFimSuffix, 50283}};
  p50k_edit.file = "p50k_base.tiktoken";
  schemes.push_back(std::move(p50k_edit));

  SchemeSpec cl100k;
  cl100k.name = "cl100k_base";
  cl100k.pattern = kCl100kPattern;
  cl100k.special_tokens = {
      {kEndOfText, 100257}, {kFimPrefix, 100258}, {kFimMiddle, 100259}, {kFimSuffix, 100260}, {kEndOfPrompt, 100276}};
  cl100k.file = "cl100k_base.tiktoken";
  schemes.push_back(std::move(cl100k));

  SchemeSpec o200k;
  o200k.name = "o200k_base";
  o200k.pattern = kO200kPattern;
  o200k.special_tokens = {{kEndOfText, 199999}, {kEndOfPrompt, 200018}};
  o200k.file = "o200k_base.tiktoken";
  schemes.push_back(std::move(o200k));

  return schemes;
}

std::string ResolveVocabFile(const std::string& vocab_dir, const std::string& file) {
  const std::filesystem::path path = std::filesystem::path(vocab_dir) / file;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    return path.string();
  }
  std::filesystem::path gz = path;
  gz += ".gz";
  if (std::filesystem::exists(gz, ec)) {
    return gz.string();
  }
  throw VocabularyError("vocabulary file not found: " + path.string());
}

}  // namespace

const std::vector<SchemeSpec>& Schemes() {
  static const std::vector<SchemeSpec> schemes = BuildSchemes();
  return schemes;
}

const SchemeSpec* FindScheme(std::string_view name) {
  for (const auto& spec : Schemes()) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

std::vector<std::string> ListEncodingNames() {
  std::vector<std::string> names;
  for (const auto& spec : Schemes()) {
    names.push_back(spec.name);
  }
  return names;
}

std::unique_ptr<Encoding> BuildEncoding(const SchemeSpec& spec,
                                        const std::string& vocab_dir,
                                        const EncodingOptions& options) {
  ByteRankMap ranks;
  if (spec.format == VocabFormat::data_gym) {
    ranks = DataGymToMergeableBpeRanks(ResolveVocabFile(vocab_dir, spec.file),
                                       ResolveVocabFile(vocab_dir, spec.aux_file));
  } else {
    ranks = LoadTiktokenBpe(ResolveVocabFile(vocab_dir, spec.file));
  }

  auto encoding = std::make_unique<Encoding>(spec.name, RankTable(std::move(ranks)),
                                             SpecialTokenTable(spec.special_tokens), spec.pattern, options);

  if (spec.explicit_n_vocab) {
    const std::size_t n_vocab = *spec.explicit_n_vocab;
    const std::size_t loaded = encoding->ranks().size() + encoding->specials().size();
    if (loaded != n_vocab || encoding->VocabSize() != n_vocab) {
      throw VocabularyError(spec.name + ": expected " + std::to_string(n_vocab) + " tokens, loaded " +
                            std::to_string(loaded) + " with max token " +
                            std::to_string(encoding->MaxTokenValue()));
    }
  }
  return encoding;
}

std::shared_ptr<const Encoding> GetEncoding(const std::string& name, const Config& cfg) {
  const SchemeSpec* spec = FindScheme(name);
  if (!spec) {
    throw UnknownEncoding(name);
  }

  static std::mutex mu;
  static std::unordered_map<std::string, std::shared_ptr<const Encoding>> instances;

  const EncodingOptions options = ToEncodingOptions(cfg);
  const std::string key = cfg.vocab_dir + '\n' + name + '\n' + std::to_string(options.cache_max_entries) + '\n' +
                          std::to_string(options.threads);
  std::lock_guard<std::mutex> lock(mu);
  if (auto it = instances.find(key); it != instances.end()) {
    return it->second;
  }
  std::shared_ptr<const Encoding> encoding = BuildEncoding(*spec, cfg.vocab_dir, options);
  instances.emplace(key, encoding);
  return encoding;
}

}  // namespace rankbpe
