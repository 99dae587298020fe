#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "fixtures.hpp"
#include "rankbpe/byte_pair.hpp"
#include "rankbpe/errors.hpp"

using namespace rankbpe;

namespace {

// Deterministic generator so failures reproduce.
struct Lcg {
  std::uint64_t state;
  std::uint32_t Next() {
    state = state * 6364136223846793005ull + 1442695040888963407ull;
    return static_cast<std::uint32_t>(state >> 33);
  }
};

void TestGoldenFixture() {
  // "llo" is unreachable: after "he" merges, no adjacent pair is in the table.
  RankTable without_ll(testing::ByteRanksWith({"he", "llo"}));
  assert((BytePairEncode("hello", without_ll) == std::vector<Rank>{256, 108, 108, 111}));

  RankTable with_ll(testing::ByteRanksWith({"he", "llo", "ll"}));
  assert((BytePairEncode("hello", with_ll) == std::vector<Rank>{256, 257}));
}

void TestLeftmostTieBreak() {
  RankTable ranks(testing::ByteRanksWith({"aa"}));
  assert((BytePairMerge("aaa", ranks) == std::vector<std::size_t>{0, 2, 3}));
  assert((BytePairMergeHeap("aaa", ranks) == std::vector<std::size_t>{0, 2, 3}));
  assert((BytePairEncode("aaaaa", ranks) == std::vector<Rank>{256, 256, 'a'}));
}

void TestLowestRankFirst() {
  // "bc" outranks "ab", so "abc" never merges "ab".
  RankTable ranks(testing::ByteRanksWith({"bc", "ab"}));
  const auto parts = BytePairSplit("abc", ranks);
  assert(parts.size() == 2);
  assert(parts[0] == "a");
  assert(parts[1] == "bc");
}

void TestBaseCases() {
  RankTable ranks(testing::ByteRanksWith({}));
  assert(BytePairMerge("", ranks).empty());
  assert(BytePairEncode("", ranks).empty());
  assert((BytePairMerge("x", ranks) == std::vector<std::size_t>{0, 1}));
  for (int b = 0; b < 256; ++b) {
    const std::string piece(1, static_cast<char>(b));
    assert((BytePairEncode(piece, ranks) == std::vector<Rank>{static_cast<Rank>(b)}));
  }
  // No merges at all: one token per byte, NUL included.
  const std::string raw("\xff\x00z", 3);
  assert((BytePairEncode(raw, ranks) == std::vector<Rank>{0xff, 0x00, 'z'}));
}

void TestSplitViewsIntoInput() {
  RankTable ranks(testing::HelloRanks());
  const std::string piece = " world";
  const auto parts = BytePairSplit(piece, ranks);
  assert(parts.size() == 2);
  assert(parts[0] == " wor");
  assert(parts[1] == "ld");
  assert(parts[0].data() == piece.data());
  assert(parts[1].data() == piece.data() + 4);
}

void TestHeapMatchesScan() {
  // Every pair and triple over {a, b, c} plus a few longer spans, ranked in a
  // shuffled order.
  std::vector<std::string> merges;
  const std::string alphabet = "abc";
  for (char x : alphabet) {
    for (char y : alphabet) {
      merges.push_back(std::string{x, y});
      for (char z : alphabet) {
        merges.push_back(std::string{x, y, z});
      }
    }
  }
  merges.push_back("abca");
  merges.push_back("cabb");
  merges.push_back("aaaa");
  merges.push_back("bcbcbc");

  Lcg rng{42};
  for (std::size_t i = merges.size(); i > 1; --i) {
    std::swap(merges[i - 1], merges[rng.Next() % i]);
  }

  ByteRankMap map = testing::ByteRanksWith({});
  Rank next = 256;
  for (const auto& m : merges) {
    map.emplace(m, next++);
  }
  RankTable ranks(std::move(map));

  for (int round = 0; round < 200; ++round) {
    const std::size_t len = 1 + rng.Next() % 400;
    std::string piece;
    for (std::size_t i = 0; i < len; ++i) {
      piece.push_back(alphabet[rng.Next() % alphabet.size()]);
    }
    const auto scan = BytePairMerge(piece, ranks);
    const auto heap = BytePairMergeHeap(piece, ranks);
    assert(scan == heap);
    assert(scan.front() == 0);
    assert(scan.back() == piece.size());

    const auto encoded = BytePairEncode(piece, ranks);
    assert(encoded.size() + 1 == scan.size());
    std::string rebuilt;
    for (Rank r : encoded) {
      rebuilt += *ranks.BytesOf(r);
    }
    assert(rebuilt == piece);
  }
}

void TestRankTableValidation() {
  ByteRankMap missing_byte = testing::ByteRanksWith({});
  missing_byte.erase(std::string(1, 'q'));
  bool threw = false;
  try {
    RankTable bad(std::move(missing_byte));
  } catch (const VocabularyError&) {
    threw = true;
  }
  assert(threw);

  ByteRankMap duplicate = testing::ByteRanksWith({"he"});
  duplicate["ll"] = 256;
  threw = false;
  try {
    RankTable bad(std::move(duplicate));
  } catch (const VocabularyError&) {
    threw = true;
  }
  assert(threw);

  ByteRankMap empty_key = testing::ByteRanksWith({});
  empty_key[""] = 256;
  threw = false;
  try {
    RankTable bad(std::move(empty_key));
  } catch (const VocabularyError&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace

int main() {
  TestGoldenFixture();
  TestLeftmostTieBreak();
  TestLowestRankFirst();
  TestBaseCases();
  TestSplitViewsIntoInput();
  TestHeapMatchesScan();
  TestRankTableValidation();
  return 0;
}
