#include <algorithm>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "rankbpe/config.hpp"
#include "rankbpe/encoding.hpp"
#include "rankbpe/errors.hpp"
#include "rankbpe/models.hpp"
#include "rankbpe/parallel.hpp"
#include "rankbpe/progress.hpp"
#include "rankbpe/registry.hpp"

using namespace rankbpe;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitBadInput = 2;
constexpr int kExitVocabulary = 3;

struct Args {
  std::string command;
  std::vector<std::string> positional;
  std::string env_file = ".env";
  std::optional<std::string> vocab_dir;
  std::optional<std::size_t> threads;
  std::optional<std::size_t> cache_max_entries;
  std::optional<std::size_t> progress_ms;
  std::string encoding = "cl100k_base";
  std::string model;
  std::string allow_special = "none";
  std::string disallow_special = "all";
  bool ordinary = false;
  bool lossy = false;
  bool json = false;
};

enum class ParseStatus { ok, help, error };

void print_usage() {
  std::cerr << "Usage:\n"
            << "  rankbpe_cli encode [TEXT]                 token ids of TEXT (or stdin)\n"
            << "  rankbpe_cli decode [ID...]                text of the ids (or ids read from stdin)\n"
            << "  rankbpe_cli count [TEXT]                  number of tokens\n"
            << "  rankbpe_cli encode-lines <in.txt> <out>   one document per line; writes u32 length + u32 ids\n"
            << "  rankbpe_cli model <MODEL>                 encoding used by a model\n"
            << "  rankbpe_cli list                          known encodings and models\n"
            << "Options:\n"
            << "  --env-file PATH          (default .env)\n"
            << "  --vocab-dir DIR          directory with the vocabulary files\n"
            << "  --encoding NAME          (default cl100k_base)\n"
            << "  --model NAME             pick the encoding by model name\n"
            << "  --allow-special SET      all | none | comma separated tokens (default none)\n"
            << "  --disallow-special SET   all | none | comma separated tokens (default all)\n"
            << "  --ordinary               treat special tokens as plain text\n"
            << "  --lossy                  decode: replace invalid UTF-8 with U+FFFD\n"
            << "  --threads N              0 = hardware concurrency\n"
            << "  --cache-max-entries N    0 = unbounded\n"
            << "  --progress-ms N          0 = silent\n"
            << "  --json                   JSON output\n";
}

bool parse_size_arg(const char* s, std::size_t& out) {
  const std::string v = s;
  const auto [end, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
  return !v.empty() && ec == std::errc() && end == v.data() + v.size();
}

ParseStatus parse_args(int argc, char** argv, Args& args) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto need_value = [&](const std::string& name) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << name << "\n";
        return nullptr;
      }
      return argv[++i];
    };
    auto need_size = [&](const std::string& name, std::optional<std::size_t>& dst) -> bool {
      const char* v = need_value(name);
      std::size_t x = 0;
      if (!v || !parse_size_arg(v, x)) {
        if (v) {
          std::cerr << "Invalid " << name << ": " << v << "\n";
        }
        return false;
      }
      dst = x;
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      return ParseStatus::help;
    }
    if (arg == "--env-file" || arg == "--vocab-dir" || arg == "--encoding" || arg == "--model" ||
        arg == "--allow-special" || arg == "--disallow-special") {
      const char* v = need_value(arg);
      if (!v) {
        return ParseStatus::error;
      }
      if (arg == "--env-file") {
        args.env_file = v;
      } else if (arg == "--vocab-dir") {
        args.vocab_dir = v;
      } else if (arg == "--encoding") {
        args.encoding = v;
      } else if (arg == "--model") {
        args.model = v;
      } else if (arg == "--allow-special") {
        args.allow_special = v;
      } else {
        args.disallow_special = v;
      }
      continue;
    }
    if (arg == "--threads") {
      if (!need_size(arg, args.threads)) {
        return ParseStatus::error;
      }
      continue;
    }
    if (arg == "--cache-max-entries") {
      if (!need_size(arg, args.cache_max_entries)) {
        return ParseStatus::error;
      }
      continue;
    }
    if (arg == "--progress-ms") {
      if (!need_size(arg, args.progress_ms)) {
        return ParseStatus::error;
      }
      continue;
    }
    if (arg == "--ordinary") {
      args.ordinary = true;
      continue;
    }
    if (arg == "--lossy") {
      args.lossy = true;
      continue;
    }
    if (arg == "--json") {
      args.json = true;
      continue;
    }
    if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
      std::cerr << "Unknown option: " << arg << "\n";
      return ParseStatus::error;
    }
    if (args.command.empty()) {
      args.command = arg;
    } else {
      args.positional.push_back(arg);
    }
  }
  if (args.command.empty()) {
    return ParseStatus::help;
  }
  return ParseStatus::ok;
}

SpecialSet parse_special_set(const std::string& v) {
  if (v == "all") {
    return SpecialSet::All();
  }
  if (v == "none" || v.empty()) {
    return SpecialSet::None();
  }
  std::unordered_set<std::string> tokens;
  std::stringstream ss(v);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) {
      tokens.insert(item);
    }
  }
  return SpecialSet(std::move(tokens));
}

std::string read_all(std::istream& in) {
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string input_text(const Args& args) {
  if (!args.positional.empty()) {
    std::string text = args.positional[0];
    for (std::size_t i = 1; i < args.positional.size(); ++i) {
      text += " " + args.positional[i];
    }
    return text;
  }
  return read_all(std::cin);
}

std::vector<Rank> input_ids(const Args& args) {
  std::vector<std::string> words = args.positional;
  if (words.empty()) {
    std::istringstream in(read_all(std::cin));
    std::string w;
    while (in >> w) {
      words.push_back(w);
    }
  }
  std::vector<Rank> ids;
  ids.reserve(words.size());
  for (const auto& w : words) {
    Rank id = 0;
    const auto [end, ec] = std::from_chars(w.data(), w.data() + w.size(), id);
    if (ec != std::errc() || end != w.data() + w.size()) {
      throw EncodingError("not a token id: " + w);
    }
    ids.push_back(id);
  }
  return ids;
}

std::string dump_json(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void print_ids(const std::vector<Rank>& ids, const Encoding& enc, bool json) {
  if (json) {
    nlohmann::json j;
    j["encoding"] = enc.Name();
    j["tokens"] = ids;
    std::cout << dump_json(j) << "\n";
    return;
  }
  for (std::size_t i = 0; i < ids.size(); ++i) {
    std::cout << (i ? " " : "") << ids[i];
  }
  std::cout << "\n";
}

std::vector<Rank> encode_with(const Encoding& enc, const Args& args, const std::string& text,
                              const SpecialSet& allowed, const SpecialSet& disallowed) {
  return args.ordinary ? enc.EncodeOrdinary(text) : enc.Encode(text, allowed, disallowed);
}

int run_encode_lines(const Encoding& enc, const Args& args, const Config& cfg) {
  if (args.positional.size() != 2) {
    print_usage();
    return kExitUsage;
  }
  std::ifstream in(args.positional[0], std::ios::binary);
  if (!in) {
    std::cerr << "error: failed to open " << args.positional[0] << "\n";
    return kExitBadInput;
  }
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
  }

  const SpecialSet allowed = parse_special_set(args.allow_special);
  const SpecialSet disallowed = parse_special_set(args.disallow_special);
  std::vector<std::vector<Rank>> encoded(lines.size());
  ProgressTracker progress(lines.size(), "encode-lines", cfg.progress_interval_ms);

  const std::size_t threads = std::max<std::size_t>(1, std::min(EffectiveThreads(cfg.threads), lines.size()));
  ParallelFor(lines.size(), threads, [&](std::size_t i) {
    encoded[i] = encode_with(enc, args, lines[i], allowed, disallowed);
    progress.add(1, encoded[i].size());
  });
  progress.finish();

  std::ofstream out(args.positional[1], std::ios::binary);
  if (!out) {
    std::cerr << "error: failed to create " << args.positional[1] << "\n";
    return kExitBadInput;
  }
  std::uint64_t total_tokens = 0;
  for (const auto& ids : encoded) {
    const auto n = static_cast<std::uint32_t>(ids.size());
    out.write(reinterpret_cast<const char*>(&n), sizeof(n));
    out.write(reinterpret_cast<const char*>(ids.data()), static_cast<std::streamsize>(ids.size() * sizeof(Rank)));
    total_tokens += ids.size();
  }
  if (!out) {
    std::cerr << "error: failed to write " << args.positional[1] << "\n";
    return kExitBadInput;
  }

  if (args.json) {
    nlohmann::json j;
    j["encoding"] = enc.Name();
    j["lines"] = lines.size();
    j["tokens"] = total_tokens;
    std::cout << dump_json(j) << "\n";
  } else {
    std::cout << "encoded " << lines.size() << " lines, " << total_tokens << " tokens\n";
  }
  return 0;
}

int run_list(bool json) {
  const auto encodings = ListEncodingNames();
  const auto models = ListSupportedModels();
  if (json) {
    nlohmann::json j;
    j["encodings"] = encodings;
    nlohmann::json m = nlohmann::json::object();
    for (const auto& model : models) {
      m[model] = EncodingNameForModel(model);
    }
    j["models"] = m;
    std::cout << dump_json(j) << "\n";
    return 0;
  }
  std::cout << "encodings:\n";
  for (const auto& name : encodings) {
    std::cout << "  " << name << "\n";
  }
  std::cout << "models:\n";
  for (const auto& model : models) {
    std::cout << "  " << model << " -> " << EncodingNameForModel(model) << "\n";
  }
  return 0;
}

int run(const Args& args) {
  Config cfg = LoadConfig(args.env_file);
  if (args.vocab_dir) cfg.vocab_dir = *args.vocab_dir;
  if (args.threads) cfg.threads = *args.threads;
  if (args.cache_max_entries) cfg.cache_max_entries = *args.cache_max_entries;
  if (args.progress_ms) cfg.progress_interval_ms = *args.progress_ms;

  if (args.command == "list") {
    return run_list(args.json);
  }
  if (args.command == "model") {
    if (args.positional.size() != 1) {
      print_usage();
      return kExitUsage;
    }
    const std::string name = EncodingNameForModel(args.positional[0]);
    if (args.json) {
      nlohmann::json j;
      j["model"] = args.positional[0];
      j["encoding"] = name;
      std::cout << dump_json(j) << "\n";
    } else {
      std::cout << name << "\n";
    }
    return 0;
  }

  const bool known = args.command == "encode" || args.command == "decode" || args.command == "count" ||
                     args.command == "encode-lines";
  if (!known) {
    std::cerr << "Unknown command: " << args.command << "\n";
    print_usage();
    return kExitUsage;
  }

  const auto enc = args.model.empty() ? GetEncoding(args.encoding, cfg) : EncodingForModel(args.model, cfg);

  if (args.command == "encode") {
    const std::string text = input_text(args);
    print_ids(encode_with(*enc, args, text, parse_special_set(args.allow_special),
                          parse_special_set(args.disallow_special)),
              *enc, args.json);
    return 0;
  }
  if (args.command == "count") {
    const std::string text = input_text(args);
    const std::size_t n = args.ordinary ? enc->CountOrdinary(text)
                                        : enc->Count(text, parse_special_set(args.allow_special),
                                                     parse_special_set(args.disallow_special));
    if (args.json) {
      nlohmann::json j;
      j["encoding"] = enc->Name();
      j["count"] = n;
      std::cout << dump_json(j) << "\n";
    } else {
      std::cout << n << "\n";
    }
    return 0;
  }
  if (args.command == "decode") {
    const auto ids = input_ids(args);
    const std::string text = args.lossy ? enc->DecodeLossy(ids) : enc->Decode(ids);
    if (args.json) {
      nlohmann::json j;
      j["encoding"] = enc->Name();
      j["text"] = text;
      std::cout << dump_json(j) << "\n";
    } else {
      std::cout << text;
      if (text.empty() || text.back() != '\n') {
        std::cout << "\n";
      }
    }
    return 0;
  }
  return run_encode_lines(*enc, args, cfg);
}

}  // namespace

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);

  Args args;
  switch (parse_args(argc, argv, args)) {
    case ParseStatus::help:
      print_usage();
      return argc > 1 ? 0 : kExitUsage;
    case ParseStatus::error:
      return kExitUsage;
    case ParseStatus::ok:
      break;
  }

  try {
    return run(args);
  } catch (const DisallowedSpecialToken& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kExitBadInput;
  } catch (const UnknownToken& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kExitBadInput;
  } catch (const EncodingError& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kExitBadInput;
  } catch (const Error& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kExitVocabulary;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kExitUsage;
  }
}
