#include "timer.hpp"

namespace cardex {

Timer::Timer() { _begin = std::chrono::steady_clock::now(); }

std::chrono::microseconds Timer::lap() {
  const auto now = std::chrono::steady_clock::now();
  const auto lap_duration = std::chrono::duration_cast<std::chrono::microseconds>(now - _begin);
  _begin = now;
  return lap_duration;
}

}  // namespace cardex
