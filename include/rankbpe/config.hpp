#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

#include "rankbpe/encoding.hpp"

namespace rankbpe {

struct Config {
  std::string env_path = ".env";
  // Directory holding the *.tiktoken files (and vocab.bpe/encoder.json for gpt2).
  std::string vocab_dir = "vocab";
  std::size_t cache_max_entries = 0;  // 0 -> unbounded
  std::size_t threads = 0;            // 0 -> auto
  std::size_t progress_interval_ms = 1000;
};

using EnvMap = std::unordered_map<std::string, std::string>;

// KEY=VALUE lines; '#' comments, surrounding quotes and a UTF-8 BOM are
// stripped. A missing file yields an empty map.
EnvMap ReadEnvFile(const std::string& path);

// Accepts each key bare (VOCAB_DIR) or prefixed (RANKBPE_VOCAB_DIR); the
// prefixed spelling wins. Throws Error on a malformed number.
void ApplyEnvOverrides(Config& cfg, const EnvMap& env);

// RANKBPE_* variables of the running process.
void ApplyProcessEnvironment(Config& cfg);

// Defaults, then the .env file at env_path, then the process environment.
Config LoadConfig(const std::string& env_path = ".env");

[[nodiscard]] EncodingOptions ToEncodingOptions(const Config& cfg);

}  // namespace rankbpe
