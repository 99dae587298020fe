#include <algorithm>
#include <cassert>
#include <string>
#include <vector>

#include "rankbpe/errors.hpp"
#include "rankbpe/models.hpp"
#include "rankbpe/registry.hpp"

using namespace rankbpe;

namespace {

void TestModelLookup() {
  assert(EncodingNameForModel("gpt-4o") == "o200k_base");
  assert(EncodingNameForModel("gpt-4o-2024-05-13") == "o200k_base");
  assert(EncodingNameForModel("gpt-4") == "cl100k_base");
  assert(EncodingNameForModel("gpt-4-0613") == "cl100k_base");
  assert(EncodingNameForModel("gpt-3.5-turbo-16k") == "cl100k_base");
  assert(EncodingNameForModel("text-davinci-003") == "p50k_base");
  assert(EncodingNameForModel("text-davinci-edit-001") == "p50k_edit");
  assert(EncodingNameForModel("davinci") == "r50k_base");
  assert(EncodingNameForModel("gpt2") == "gpt2");
  assert(EncodingNameForModel("o1") == "o200k_base");
  assert(EncodingNameForModel("o3-mini") == "o200k_base");

  // Longest prefix wins: "ft:gpt-4o" beats "ft:gpt-4".
  assert(EncodingNameForModel("ft:gpt-4o-mini:org::abc") == "o200k_base");
  assert(EncodingNameForModel("ft:gpt-4:org::abc") == "cl100k_base");

  bool threw = false;
  try {
    (void)EncodingNameForModel("not-a-model");
  } catch (const UnknownModel& e) {
    threw = true;
    assert(e.model() == "not-a-model");
  }
  assert(threw);

  // A prefix without its dash is not a match.
  assert(!IsModelSupported("gpt-4o2"));
  assert(IsModelSupported("gpt-4o-mini"));
  assert(IsModelSupported("ada"));

  const auto models = ListSupportedModels();
  assert(std::is_sorted(models.begin(), models.end()));
  assert(std::find(models.begin(), models.end(), "gpt-4o") != models.end());
  assert(std::find(models.begin(), models.end(), "gpt-4o-") == models.end());
  for (const auto& model : models) {
    assert(FindScheme(EncodingNameForModel(model)) != nullptr);
  }
}

void TestRegistry() {
  assert((ListEncodingNames() ==
          std::vector<std::string>{"gpt2", "r50k_base", "p50k_base", "p50k_edit", "cl100k_base", "o200k_base"}));

  const SchemeSpec* cl100k = FindScheme("cl100k_base");
  assert(cl100k && cl100k->file == "cl100k_base.tiktoken");
  assert(cl100k->special_tokens.at("<|endofprompt|>") == 100276);
  assert(!cl100k->explicit_n_vocab);

  const SchemeSpec* p50k_edit = FindScheme("p50k_edit");
  assert(p50k_edit && p50k_edit->special_tokens.size() == 4);
  assert(p50k_edit->file == "p50k_base.tiktoken");

  const SchemeSpec* gpt2 = FindScheme("gpt2");
  assert(gpt2 && gpt2->format == VocabFormat::data_gym && gpt2->aux_file == "encoder.json");
  assert(gpt2->explicit_n_vocab && *gpt2->explicit_n_vocab == 50257);

  assert(FindScheme("cl100k") == nullptr);

  bool threw = false;
  try {
    (void)GetEncoding("no_such_encoding");
  } catch (const UnknownEncoding& e) {
    threw = true;
    assert(e.name() == "no_such_encoding");
  }
  assert(threw);

  Config cfg;
  cfg.vocab_dir = "/nonexistent/rankbpe/vocab";
  threw = false;
  try {
    (void)GetEncoding("r50k_base", cfg);
  } catch (const VocabularyError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)EncodingForModel("gpt-4o", cfg);
  } catch (const VocabularyError&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace

int main() {
  TestModelLookup();
  TestRegistry();
  return 0;
}
