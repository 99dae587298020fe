#include "rankbpe/parallel.hpp"

#include <thread>

namespace rankbpe {

std::size_t EffectiveThreads(std::size_t configured) {
  if (configured > 0) {
    return configured;
  }
  const auto hw = std::thread::hardware_concurrency();
  return hw == 0 ? 4 : hw;
}

}  // namespace rankbpe
