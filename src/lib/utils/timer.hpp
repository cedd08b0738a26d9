#pragma once

#include <chrono>

namespace cardex {

/**
 * Measures the wall time passed since construction or the last call to lap()
 */
class Timer final {
 public:
  Timer();

  std::chrono::microseconds lap();

 private:
  std::chrono::steady_clock::time_point _begin;
};

}  // namespace cardex
