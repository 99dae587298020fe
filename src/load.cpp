#include "rankbpe/load.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>
#include <unicode/utf8.h>
#include <zlib.h>

#include "rankbpe/errors.hpp"

namespace rankbpe {

namespace {

bool EndsWith(const std::string& s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool DecodeBase64(std::string_view input, std::string& out) {
  static const std::array<std::int8_t, 256> table = [] {
    std::array<std::int8_t, 256> t{};
    t.fill(-1);
    for (int i = 0; i < 26; ++i) t[static_cast<std::uint8_t>('A' + i)] = static_cast<std::int8_t>(i);
    for (int i = 0; i < 26; ++i) t[static_cast<std::uint8_t>('a' + i)] = static_cast<std::int8_t>(26 + i);
    for (int i = 0; i < 10; ++i) t[static_cast<std::uint8_t>('0' + i)] = static_cast<std::int8_t>(52 + i);
    t[static_cast<std::uint8_t>('+')] = 62;
    t[static_cast<std::uint8_t>('/')] = 63;
    return t;
  }();

  out.clear();
  out.reserve(input.size() * 3 / 4);
  unsigned int buffer = 0;
  int bits_collected = 0;
  std::size_t i = 0;
  for (; i < input.size() && input[i] != '='; ++i) {
    const std::int8_t val = table[static_cast<std::uint8_t>(input[i])];
    if (val < 0) {
      return false;
    }
    buffer = (buffer << 6) | static_cast<unsigned int>(val);
    bits_collected += 6;
    if (bits_collected >= 8) {
      bits_collected -= 8;
      out.push_back(static_cast<char>((buffer >> bits_collected) & 0xFF));
    }
  }
  // Only padding may follow the first '='.
  for (; i < input.size(); ++i) {
    if (input[i] != '=') {
      return false;
    }
  }
  return true;
}

// GPT-2's byte <-> printable code point table: bytes that print as
// themselves keep their code point, the rest map to 256 + n in byte order.
std::array<int, 512> BuildCodePointToByte() {
  std::array<bool, 256> printable{};
  for (int b = 33; b <= 126; ++b) printable[b] = true;
  for (int b = 161; b <= 172; ++b) printable[b] = true;
  for (int b = 174; b <= 255; ++b) printable[b] = true;

  std::array<int, 512> map{};
  map.fill(-1);
  int n = 0;
  for (int b = 0; b < 256; ++b) {
    if (printable[b]) {
      map[b] = b;
    } else {
      map[256 + n] = b;
      ++n;
    }
  }
  return map;
}

// Printable-byte order: the bytes that print as themselves first, then the
// others. This is the rank order of the 256 base tokens.
std::vector<unsigned char> DataGymByteOrder() {
  std::vector<unsigned char> order;
  order.reserve(256);
  std::array<bool, 256> present{};
  auto add = [&](int lo, int hi) {
    for (int b = lo; b <= hi; ++b) {
      order.push_back(static_cast<unsigned char>(b));
      present[b] = true;
    }
  };
  add(33, 126);
  add(161, 172);
  add(174, 255);
  for (int b = 0; b < 256; ++b) {
    if (!present[b]) {
      order.push_back(static_cast<unsigned char>(b));
    }
  }
  return order;
}

std::string DecodeDataGym(std::string_view token, const std::array<int, 512>& cp_to_byte) {
  std::string out;
  out.reserve(token.size());
  const auto* s = reinterpret_cast<const std::uint8_t*>(token.data());
  const auto length = static_cast<std::int32_t>(token.size());
  std::int32_t i = 0;
  while (i < length) {
    UChar32 cp = 0;
    U8_NEXT(s, i, length, cp);
    if (cp < 0 || cp >= static_cast<UChar32>(cp_to_byte.size()) || cp_to_byte[cp] < 0) {
      throw VocabularyError("data gym token contains a character outside the byte alphabet: " + std::string(token));
    }
    out.push_back(static_cast<char>(cp_to_byte[cp]));
  }
  return out;
}

}  // namespace

std::string Base64Decode(std::string_view input) {
  std::string out;
  if (!DecodeBase64(input, out)) {
    throw VocabularyError("invalid base64: " + std::string(input));
  }
  return out;
}

std::string ReadFileBytes(const std::string& path) {
  if (EndsWith(path, ".gz")) {
    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) {
      throw VocabularyError("failed to open " + path);
    }
    std::string payload;
    char buf[1 << 15];
    int read_n = 0;
    while ((read_n = gzread(gz, buf, sizeof(buf))) > 0) {
      payload.append(buf, static_cast<std::size_t>(read_n));
    }
    if (read_n < 0) {
      int errnum = 0;
      const std::string message = gzerror(gz, &errnum);
      gzclose(gz);
      throw VocabularyError("failed to inflate " + path + ": " + message);
    }
    gzclose(gz);
    return payload;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw VocabularyError("failed to open " + path);
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  if (in.bad()) {
    throw VocabularyError("failed to read " + path);
  }
  return oss.str();
}

ByteRankMap ParseTiktokenBpe(std::string_view contents, const std::string& source) {
  auto line_error = [&](std::size_t line_no, const std::string& what) {
    return VocabularyError((source.empty() ? std::string() : source + ": ") + "line " + std::to_string(line_no) + ": " + what);
  };
  ByteRankMap ranks;
  std::size_t line_no = 0;
  std::size_t pos = 0;
  std::string token;
  while (pos < contents.size()) {
    std::size_t eol = contents.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = contents.size();
    }
    std::string_view line = contents.substr(pos, eol - pos);
    pos = eol + 1;
    ++line_no;

    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    const std::size_t first = line.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
      continue;
    }
    line.remove_prefix(first);
    const std::size_t last = line.find_last_not_of(" \t");
    line = line.substr(0, last + 1);

    const std::size_t sep = line.find_first_of(" \t");
    if (sep == std::string_view::npos) {
      throw line_error(line_no, "expected \"<base64> <rank>\"");
    }
    const std::string_view b64 = line.substr(0, sep);
    std::string_view rank_text = line.substr(sep);
    rank_text.remove_prefix(rank_text.find_first_not_of(" \t"));
    if (rank_text.find_first_of(" \t") != std::string_view::npos) {
      throw line_error(line_no, "expected \"<base64> <rank>\"");
    }

    if (!DecodeBase64(b64, token)) {
      throw line_error(line_no, "invalid base64 " + std::string(b64));
    }
    Rank rank = 0;
    const auto [end, ec] = std::from_chars(rank_text.data(), rank_text.data() + rank_text.size(), rank);
    if (ec != std::errc() || end != rank_text.data() + rank_text.size()) {
      throw line_error(line_no, "invalid rank " + std::string(rank_text));
    }
    if (!ranks.emplace(token, rank).second) {
      throw line_error(line_no, "duplicate token " + std::string(b64));
    }
  }
  return ranks;
}

ByteRankMap LoadTiktokenBpe(const std::string& path) {
  return ParseTiktokenBpe(ReadFileBytes(path), path);
}

ByteRankMap DataGymToMergeableBpeRanksFromContents(std::string_view vocab_bpe, std::string_view encoder_json) {
  const auto cp_to_byte = BuildCodePointToByte();

  ByteRankMap ranks;
  Rank next_rank = 0;
  for (unsigned char b : DataGymByteOrder()) {
    ranks.emplace(std::string(1, static_cast<char>(b)), next_rank++);
  }

  // The first line is a version header.
  std::size_t pos = vocab_bpe.find('\n');
  std::size_t line_no = 1;
  while (pos != std::string_view::npos && pos < vocab_bpe.size()) {
    ++pos;
    std::size_t eol = vocab_bpe.find('\n', pos);
    std::string_view line = vocab_bpe.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
    pos = eol;
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.empty()) {
      continue;
    }
    const std::size_t sep = line.find(' ');
    if (sep == std::string_view::npos || sep == 0 || sep + 1 >= line.size() ||
        line.find(' ', sep + 1) != std::string_view::npos) {
      throw VocabularyError("vocab.bpe line " + std::to_string(line_no) + ": expected \"<first> <second>\"");
    }
    std::string merged = DecodeDataGym(line.substr(0, sep), cp_to_byte) + DecodeDataGym(line.substr(sep + 1), cp_to_byte);
    ranks.insert_or_assign(std::move(merged), next_rank++);
  }

  const auto j = nlohmann::json::parse(encoder_json.begin(), encoder_json.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw VocabularyError("encoder.json is not a JSON object");
  }
  ByteRankMap expected;
  for (const auto& [key, value] : j.items()) {
    if (key == "<|endoftext|>" || key == "<|startoftext|>") {
      continue;
    }
    if (!value.is_number_unsigned()) {
      throw VocabularyError("encoder.json: id of " + key + " is not an unsigned integer");
    }
    expected.emplace(DecodeDataGym(key, cp_to_byte), value.get<Rank>());
  }
  if (expected != ranks) {
    throw VocabularyError("vocab.bpe and encoder.json disagree (" + std::to_string(ranks.size()) + " vs " +
                          std::to_string(expected.size()) + " tokens)");
  }
  return ranks;
}

ByteRankMap DataGymToMergeableBpeRanks(const std::string& vocab_bpe_path, const std::string& encoder_json_path) {
  const std::string vocab_bpe = ReadFileBytes(vocab_bpe_path);
  const std::string encoder_json = ReadFileBytes(encoder_json_path);
  return DataGymToMergeableBpeRanksFromContents(vocab_bpe, encoder_json);
}

}  // namespace rankbpe
