#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <zlib.h>

#include "fixtures.hpp"
#include "rankbpe/errors.hpp"
#include "rankbpe/load.hpp"
#include "rankbpe/registry.hpp"

using namespace rankbpe;
namespace fs = std::filesystem;

namespace {

std::string Base64Encode(const std::string& in) {
  static const char* kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  std::size_t i = 0;
  for (; i + 2 < in.size(); i += 3) {
    const unsigned v = (static_cast<unsigned char>(in[i]) << 16) | (static_cast<unsigned char>(in[i + 1]) << 8) |
                       static_cast<unsigned char>(in[i + 2]);
    out += kAlphabet[(v >> 18) & 63];
    out += kAlphabet[(v >> 12) & 63];
    out += kAlphabet[(v >> 6) & 63];
    out += kAlphabet[v & 63];
  }
  const std::size_t rest = in.size() - i;
  if (rest == 1) {
    const unsigned v = static_cast<unsigned char>(in[i]) << 16;
    out += kAlphabet[(v >> 18) & 63];
    out += kAlphabet[(v >> 12) & 63];
    out += "==";
  } else if (rest == 2) {
    const unsigned v = (static_cast<unsigned char>(in[i]) << 16) | (static_cast<unsigned char>(in[i + 1]) << 8);
    out += kAlphabet[(v >> 18) & 63];
    out += kAlphabet[(v >> 12) & 63];
    out += kAlphabet[(v >> 6) & 63];
    out += '=';
  }
  return out;
}

// "<base64> <rank>" lines for every byte plus "he" at 256.
std::string TinyTiktokenFile() {
  std::string out;
  for (const auto& [bytes, rank] : testing::ByteRanksWith({"he"})) {
    out += Base64Encode(bytes) + " " + std::to_string(rank) + "\n";
  }
  return out;
}

fs::path MakeTempDir(const std::string& tag) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path dir = fs::temp_directory_path() / ("rankbpe_" + tag + "_" + std::to_string(stamp));
  fs::create_directories(dir);
  return dir;
}

void WriteFile(const fs::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary);
  out << contents;
}

void WriteGzFile(const fs::path& path, const std::string& contents) {
  gzFile gz = gzopen(path.string().c_str(), "wb");
  assert(gz != nullptr);
  const int written = gzwrite(gz, contents.data(), static_cast<unsigned>(contents.size()));
  assert(written == static_cast<int>(contents.size()));
  gzclose(gz);
}

template <typename Fn>
std::string ErrorMessage(Fn&& fn) {
  try {
    fn();
  } catch (const VocabularyError& e) {
    return e.what();
  }
  return {};
}

// UTF-8 spelling of a byte in the GPT-2 printable alphabet.
std::string DataGymChar(int byte) {
  static const std::vector<int> code_points = [] {
    std::vector<int> cps(256, -1);
    int n = 0;
    for (int b = 0; b < 256; ++b) {
      const bool printable = (b >= 33 && b <= 126) || (b >= 161 && b <= 172) || (b >= 174 && b <= 255);
      cps[b] = printable ? b : 256 + n++;
    }
    return cps;
  }();
  const int cp = code_points[byte];
  if (cp < 0x80) {
    return std::string(1, static_cast<char>(cp));
  }
  return std::string{static_cast<char>(0xC0 | (cp >> 6)), static_cast<char>(0x80 | (cp & 0x3F))};
}

nlohmann::json DataGymEncoder() {
  nlohmann::json encoder = nlohmann::json::object();
  int rank = 0;
  auto add = [&](int lo, int hi) {
    for (int b = lo; b <= hi; ++b) {
      encoder[DataGymChar(b)] = rank++;
    }
  };
  add(33, 126);
  add(161, 172);
  add(174, 255);
  add(0, 32);
  add(127, 160);
  add(173, 173);
  encoder["he"] = 256;
  encoder[DataGymChar(' ') + "w"] = 257;
  encoder["<|endoftext|>"] = 258;
  return encoder;
}

const std::string kDataGymMerges = "#version: 0.2\nh e\n\xC4\xA0 w\n\n";

void TestBase64() {
  assert(Base64Decode("aGVsbG8=") == "hello");
  assert(Base64Decode("aGk") == "hi");
  assert(Base64Decode("").empty());
  assert(Base64Decode("AA==") == std::string(1, '\0'));
  bool threw = false;
  try {
    (void)Base64Decode("a=b");
  } catch (const VocabularyError&) {
    threw = true;
  }
  assert(threw);
  threw = false;
  try {
    (void)Base64Decode("a*bc");
  } catch (const VocabularyError&) {
    threw = true;
  }
  assert(threw);
}

void TestParseTiktoken() {
  const auto ranks = ParseTiktokenBpe("aGU= 256\n\n  bGw=\t257\r\n");
  assert(ranks.size() == 2);
  assert(ranks.at("he") == 256);
  assert(ranks.at("ll") == 257);

  std::string msg = ErrorMessage([] { (void)ParseTiktokenBpe("aGU= 256\nbroken\n"); });
  assert(msg.find("line 2") != std::string::npos);

  msg = ErrorMessage([] { (void)ParseTiktokenBpe("aGU= x1", "r.tiktoken"); });
  assert(msg.find("r.tiktoken: line 1") != std::string::npos);

  msg = ErrorMessage([] { (void)ParseTiktokenBpe("aGU= 1\n\naGU= 2\n"); });
  assert(msg.find("line 3") != std::string::npos);

  msg = ErrorMessage([] { (void)ParseTiktokenBpe("a*U= 1\n"); });
  assert(msg.find("line 1") != std::string::npos);
}

void TestLoadPlainAndGzip() {
  const fs::path dir = MakeTempDir("load");
  const std::string contents = TinyTiktokenFile();
  WriteFile(dir / "tiny.tiktoken", contents);
  WriteGzFile(dir / "packed.tiktoken.gz", contents);

  const auto plain = LoadTiktokenBpe((dir / "tiny.tiktoken").string());
  const auto packed = LoadTiktokenBpe((dir / "packed.tiktoken.gz").string());
  assert(plain.size() == 257);
  assert(plain == packed);
  assert(ReadFileBytes((dir / "packed.tiktoken.gz").string()) == contents);

  const std::string msg = ErrorMessage([&] { (void)LoadTiktokenBpe((dir / "absent.tiktoken").string()); });
  assert(msg.find("absent.tiktoken") != std::string::npos);

  // Scheme files resolve with a .gz fallback.
  SchemeSpec spec;
  spec.name = "tiny";
  spec.pattern = kR50kPattern;
  spec.special_tokens = {{"<|endoftext|>", 257}};
  spec.explicit_n_vocab = 258;
  spec.file = "packed.tiktoken";
  auto enc = BuildEncoding(spec, dir.string());
  assert(enc->Name() == "tiny");
  assert(enc->VocabSize() == 258);
  assert((enc->Encode("hehe<|endoftext|>", SpecialSet::All()) == std::vector<Rank>{256, 256, 257}));

  spec.explicit_n_vocab = 300;
  bool threw = false;
  try {
    (void)BuildEncoding(spec, dir.string());
  } catch (const VocabularyError&) {
    threw = true;
  }
  assert(threw);

  spec.file = "missing.tiktoken";
  threw = false;
  try {
    (void)BuildEncoding(spec, dir.string());
  } catch (const VocabularyError&) {
    threw = true;
  }
  assert(threw);

  fs::remove_all(dir);
}

void TestGetEncodingKeysOnOptions() {
  const fs::path dir = MakeTempDir("registry");
  WriteFile(dir / "cl100k_base.tiktoken", TinyTiktokenFile());

  Config cfg;
  cfg.vocab_dir = dir.string();
  const auto first = GetEncoding("cl100k_base", cfg);
  assert(GetEncoding("cl100k_base", cfg) == first);
  assert(first->VocabSize() == 100277);
  assert(first->options().cache_max_entries == 0);

  Config bounded = cfg;
  bounded.cache_max_entries = 8;
  const auto small = GetEncoding("cl100k_base", bounded);
  assert(small != first);
  assert(small->options().cache_max_entries == 8);
  assert(GetEncoding("cl100k_base", bounded) == small);

  Config threaded = cfg;
  threaded.threads = 2;
  const auto with_threads = GetEncoding("cl100k_base", threaded);
  assert(with_threads != first && with_threads != small);
  assert(with_threads->options().threads == 2);

  fs::remove_all(dir);
}

void TestDataGym() {
  const auto encoder = DataGymEncoder();
  const auto ranks = DataGymToMergeableBpeRanksFromContents(kDataGymMerges, encoder.dump());
  assert(ranks.size() == 258);
  assert(ranks.at("!") == 0);
  assert(ranks.at(std::string(1, '\0')) == 188);
  assert(ranks.at(" ") == 188 + 32);
  assert(ranks.at("he") == 256);
  assert(ranks.at(" w") == 257);

  auto wrong = encoder;
  wrong["he"] = 300;
  bool threw = false;
  try {
    (void)DataGymToMergeableBpeRanksFromContents(kDataGymMerges, wrong.dump());
  } catch (const VocabularyError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)DataGymToMergeableBpeRanksFromContents(kDataGymMerges, "[1, 2]");
  } catch (const VocabularyError&) {
    threw = true;
  }
  assert(threw);

  // gpt2 loads from the same pair of files on disk.
  const fs::path dir = MakeTempDir("datagym");
  WriteFile(dir / "vocab.bpe", kDataGymMerges);
  WriteFile(dir / "encoder.json", encoder.dump());
  const auto from_files =
      DataGymToMergeableBpeRanks((dir / "vocab.bpe").string(), (dir / "encoder.json").string());
  assert(from_files == ranks);
  fs::remove_all(dir);
}

}  // namespace

int main() {
  TestBase64();
  TestParseTiktoken();
  TestLoadPlainAndGzip();
  TestGetEncodingKeysOnOptions();
  TestDataGym();
  return 0;
}
