#include "interrupt_token.hpp"

namespace cardex {

void InterruptToken::interrupt() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _interrupted = true;
  }
  _condition.notify_all();
}

void InterruptToken::clear() {
  std::lock_guard<std::mutex> lock(_mutex);
  _interrupted = false;
}

bool InterruptToken::is_interrupted() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _interrupted;
}

bool InterruptToken::sleep_for(const std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(_mutex);
  return _condition.wait_for(lock, duration, [&]() { return _interrupted; });
}

}  // namespace cardex
