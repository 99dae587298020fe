#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rankbpe/config.hpp"
#include "rankbpe/encoding.hpp"

namespace rankbpe {

// Exact model names first, then the longest matching prefix
// ("gpt-4o-2024-05-13" -> o200k_base). Throws UnknownModel.
[[nodiscard]] std::string EncodingNameForModel(const std::string& model);

// Exact names only, sorted.
[[nodiscard]] std::vector<std::string> ListSupportedModels();

[[nodiscard]] bool IsModelSupported(const std::string& model);

[[nodiscard]] std::shared_ptr<const Encoding> EncodingForModel(const std::string& model, const Config& cfg = Config{});

}  // namespace rankbpe
