#include "rankbpe/config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <initializer_list>

#include "rankbpe/errors.hpp"

namespace rankbpe {

namespace {

constexpr std::string_view kEnvPrefix = "RANKBPE_";

std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

std::size_t ParseSize(const std::string& key, const std::string& value) {
  std::size_t out = 0;
  const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (value.empty() || ec != std::errc() || end != value.data() + value.size()) {
    throw Error("invalid value for " + key + ": " + value);
  }
  return out;
}

// Returns the value of the first spelling present, or nullptr.
const std::string* Find(const EnvMap& env, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    const std::string prefixed = std::string(kEnvPrefix) + key;
    if (auto it = env.find(prefixed); it != env.end()) {
      return &it->second;
    }
  }
  for (const char* key : keys) {
    if (auto it = env.find(key); it != env.end()) {
      return &it->second;
    }
  }
  return nullptr;
}

}  // namespace

EnvMap ReadEnvFile(const std::string& path) {
  EnvMap env;
  std::ifstream in(path);
  if (!in) {
    return env;
  }
  bool first_line = true;
  std::string line;
  while (std::getline(in, line)) {
    if (first_line) {
      first_line = false;
      if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
          static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
      }
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string key = Trim(trimmed.substr(0, eq));
    std::string val = Trim(trimmed.substr(eq + 1));
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
      val = val.substr(1, val.size() - 2);
    }
    env[key] = val;
  }
  return env;
}

void ApplyEnvOverrides(Config& cfg, const EnvMap& env) {
  if (auto v = Find(env, {"VOCAB_DIR"})) {
    cfg.vocab_dir = *v;
  }
  if (auto v = Find(env, {"CACHE_MAX_ENTRIES"})) {
    cfg.cache_max_entries = ParseSize("CACHE_MAX_ENTRIES", *v);
  }
  if (auto v = Find(env, {"THREADS"})) {
    cfg.threads = ParseSize("THREADS", *v);
  }
  if (auto v = Find(env, {"PROGRESS_INTERVAL_MS", "PROGRESS_MS"})) {
    cfg.progress_interval_ms = ParseSize("PROGRESS_INTERVAL_MS", *v);
  }
}

void ApplyProcessEnvironment(Config& cfg) {
  EnvMap env;
  for (const char* key : {"VOCAB_DIR", "CACHE_MAX_ENTRIES", "THREADS", "PROGRESS_INTERVAL_MS", "PROGRESS_MS"}) {
    const std::string name = std::string(kEnvPrefix) + key;
    if (const char* value = std::getenv(name.c_str())) {
      env[name] = value;
    }
  }
  ApplyEnvOverrides(cfg, env);
}

Config LoadConfig(const std::string& env_path) {
  Config cfg;
  cfg.env_path = env_path;
  ApplyEnvOverrides(cfg, ReadEnvFile(cfg.env_path));
  ApplyProcessEnvironment(cfg);
  return cfg;
}

EncodingOptions ToEncodingOptions(const Config& cfg) {
  EncodingOptions options;
  options.cache_max_entries = cfg.cache_max_entries;
  options.threads = cfg.threads;
  return options;
}

}  // namespace rankbpe
