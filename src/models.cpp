#include "rankbpe/models.hpp"

#include <algorithm>
#include <string_view>
#include <utility>

#include "rankbpe/errors.hpp"
#include "rankbpe/registry.hpp"

namespace rankbpe {

namespace {

struct ModelEntry {
  std::string_view name;
  std::string_view encoding;
};

constexpr ModelEntry kModelPrefixes[] = {
    // reasoning
    {"o1-", "o200k_base"},
    {"o3-", "o200k_base"},
    {"o4-mini-", "o200k_base"},
    // chat
    {"gpt-5-", "o200k_base"},
    {"gpt-4.5-", "o200k_base"},
    {"gpt-4.1-", "o200k_base"},
    {"chatgpt-4o-", "o200k_base"},
    {"gpt-4o-", "o200k_base"},
    {"gpt-4-", "cl100k_base"},
    {"gpt-3.5-turbo-", "cl100k_base"},
    {"gpt-35-turbo-", "cl100k_base"},  // Azure deployment name
    // fine-tuned
    {"ft:gpt-4o", "o200k_base"},
    {"ft:gpt-4", "cl100k_base"},
    {"ft:gpt-3.5-turbo", "cl100k_base"},
    {"ft:davinci-002", "cl100k_base"},
    {"ft:babbage-002", "cl100k_base"},
};

constexpr ModelEntry kModels[] = {
    // reasoning
    {"o1", "o200k_base"},
    {"o3", "o200k_base"},
    {"o4-mini", "o200k_base"},
    // chat
    {"gpt-5", "o200k_base"},
    {"gpt-4.1", "o200k_base"},
    {"gpt-4o", "o200k_base"},
    {"gpt-4", "cl100k_base"},
    {"gpt-3.5-turbo", "cl100k_base"},
    {"gpt-3.5", "cl100k_base"},
    {"gpt-35-turbo", "cl100k_base"},
    // base
    {"davinci-002", "cl100k_base"},
    {"babbage-002", "cl100k_base"},
    // embeddings
    {"text-embedding-ada-002", "cl100k_base"},
    {"text-embedding-3-small", "cl100k_base"},
    {"text-embedding-3-large", "cl100k_base"},
    // deprecated text
    {"text-davinci-003", "p50k_base"},
    {"text-davinci-002", "p50k_base"},
    {"text-davinci-001", "r50k_base"},
    {"text-curie-001", "r50k_base"},
    {"text-babbage-001", "r50k_base"},
    {"text-ada-001", "r50k_base"},
    {"davinci", "r50k_base"},
    {"curie", "r50k_base"},
    {"babbage", "r50k_base"},
    {"ada", "r50k_base"},
    // deprecated code
    {"code-davinci-002", "p50k_base"},
    {"code-davinci-001", "p50k_base"},
    {"code-cushman-002", "p50k_base"},
    {"code-cushman-001", "p50k_base"},
    {"davinci-codex", "p50k_base"},
    {"cushman-codex", "p50k_base"},
    // deprecated edit
    {"text-davinci-edit-001", "p50k_edit"},
    {"code-davinci-edit-001", "p50k_edit"},
    // deprecated embeddings
    {"text-similarity-davinci-001", "r50k_base"},
    {"text-similarity-curie-001", "r50k_base"},
    {"text-similarity-babbage-001", "r50k_base"},
    {"text-similarity-ada-001", "r50k_base"},
    {"text-search-davinci-doc-001", "r50k_base"},
    {"text-search-curie-doc-001", "r50k_base"},
    {"text-search-babbage-doc-001", "r50k_base"},
    {"text-search-ada-doc-001", "r50k_base"},
    {"code-search-babbage-code-001", "r50k_base"},
    {"code-search-ada-code-001", "r50k_base"},
    // open
    {"gpt2", "gpt2"},
    {"gpt-2", "gpt2"},
};

}  // namespace

std::string EncodingNameForModel(const std::string& model) {
  for (const auto& entry : kModels) {
    if (entry.name == model) {
      return std::string(entry.encoding);
    }
  }

  const ModelEntry* best = nullptr;
  for (const auto& entry : kModelPrefixes) {
    if (model.compare(0, entry.name.size(), entry.name) == 0 && (!best || entry.name.size() > best->name.size())) {
      best = &entry;
    }
  }
  if (!best) {
    throw UnknownModel(model);
  }
  return std::string(best->encoding);
}

std::vector<std::string> ListSupportedModels() {
  std::vector<std::string> out;
  for (const auto& entry : kModels) {
    out.emplace_back(entry.name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool IsModelSupported(const std::string& model) {
  if (std::any_of(std::begin(kModels), std::end(kModels), [&](const ModelEntry& e) { return e.name == model; })) {
    return true;
  }
  return std::any_of(std::begin(kModelPrefixes), std::end(kModelPrefixes),
                     [&](const ModelEntry& e) { return model.compare(0, e.name.size(), e.name) == 0; });
}

std::shared_ptr<const Encoding> EncodingForModel(const std::string& model, const Config& cfg) {
  return GetEncoding(EncodingNameForModel(model), cfg);
}

}  // namespace rankbpe
