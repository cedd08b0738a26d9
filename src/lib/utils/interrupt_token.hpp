#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace cardex {

/**
 * Lets another thread interrupt a thread that is waiting in an interruptible sleep. The interrupted state stays set
 * until clear() is called, so code further up the stack can still observe it.
 */
class InterruptToken final {
 public:
  void interrupt();
  void clear();

  bool is_interrupted() const;

  // Sleeps for `duration` or until interrupted. Returns true if the token is interrupted.
  bool sleep_for(const std::chrono::milliseconds duration) const;

 private:
  mutable std::mutex _mutex;
  mutable std::condition_variable _condition;
  bool _interrupted{false};
};

}  // namespace cardex
