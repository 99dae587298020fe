#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

#include "rankbpe/encoding.hpp"
#include "rankbpe/registry.hpp"
#include "rankbpe/vocab.hpp"

namespace rankbpe::testing {

// Every single byte at rank == byte value, then the given merges in order
// starting at 256.
inline ByteRankMap ByteRanksWith(std::initializer_list<const char*> merges) {
  ByteRankMap ranks;
  for (int b = 0; b < 256; ++b) {
    ranks.emplace(std::string(1, static_cast<char>(b)), static_cast<Rank>(b));
  }
  Rank next = 256;
  for (const char* m : merges) {
    ranks.emplace(m, next++);
  }
  return ranks;
}

// he=256 ll=257 llo=258 " w"=259 or=260 " wor"=261 ld=262, <|endoftext|>=300.
inline ByteRankMap HelloRanks() { return ByteRanksWith({"he", "ll", "llo", " w", "or", " wor", "ld"}); }

inline std::unordered_map<std::string, Rank> HelloSpecials() {
  return {{"<|endoftext|>", 300}, {"<|fim_prefix|>", 301}};
}

inline std::unique_ptr<Encoding> MakeHelloEncoding(EncodingOptions options = {}) {
  return std::make_unique<Encoding>("hello_fixture", RankTable(HelloRanks()), SpecialTokenTable(HelloSpecials()),
                                    kR50kPattern, options);
}

}  // namespace rankbpe::testing
