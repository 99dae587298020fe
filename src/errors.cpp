#include "rankbpe/errors.hpp"

#include <utility>

namespace rankbpe {

DisallowedSpecialToken::DisallowedSpecialToken(std::string token, std::size_t offset)
    : Error("disallowed special token " + token + " at byte offset " + std::to_string(offset)),
      token_(std::move(token)),
      offset_(offset) {}

UnknownToken::UnknownToken(std::uint32_t token)
    : Error("unknown token id " + std::to_string(token)), token_(token) {}

}  // namespace rankbpe
