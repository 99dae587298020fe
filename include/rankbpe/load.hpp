#pragma once

#include <string>
#include <string_view>

#include "rankbpe/vocab.hpp"

namespace rankbpe {

// Standard alphabet, optional '=' padding. Throws VocabularyError on any
// character outside the alphabet.
[[nodiscard]] std::string Base64Decode(std::string_view input);

// Whole file as bytes. Paths ending in ".gz" are inflated with zlib.
[[nodiscard]] std::string ReadFileBytes(const std::string& path);

// ".tiktoken" format: one "<base64 bytes> <rank>" per line, blank lines
// ignored. Errors name the offending line, prefixed by `source` if given.
[[nodiscard]] ByteRankMap ParseTiktokenBpe(std::string_view contents, const std::string& source = {});
[[nodiscard]] ByteRankMap LoadTiktokenBpe(const std::string& path);

// Legacy GPT-2 "data gym" pair: vocab.bpe lists merges after a version line,
// encoder.json maps the same tokens, written with the printable-byte
// alphabet, to ids. The ranks are rebuilt from the merges and must agree with
// encoder.json exactly.
[[nodiscard]] ByteRankMap DataGymToMergeableBpeRanksFromContents(std::string_view vocab_bpe,
                                                                 std::string_view encoder_json);
[[nodiscard]] ByteRankMap DataGymToMergeableBpeRanks(const std::string& vocab_bpe_path,
                                                     const std::string& encoder_json_path);

}  // namespace rankbpe
