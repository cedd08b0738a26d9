#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace cardex {

/**
 * A worker pool with an admission limit: at most `max_concurrency` jobs are executing at the same time, all further
 * submissions are queued. Workers are spawned lazily until the limit is reached and are then kept alive until
 * shutdown. No ordering is guaranteed between queued jobs.
 *
 * Jobs must not throw and should not block waiting for other jobs of the same executor. With all workers blocked,
 * the jobs they wait for would never be admitted.
 */
class BoundedExecutor final {
 public:
  using Job = std::function<void()>;

  // 4x the available hardware parallelism
  static size_t default_max_concurrency();

  explicit BoundedExecutor(const size_t max_concurrency = default_max_concurrency());
  ~BoundedExecutor();

  BoundedExecutor(const BoundedExecutor&) = delete;
  BoundedExecutor& operator=(const BoundedExecutor&) = delete;

  void submit(Job job);

  /**
   * Stops accepting new jobs and discards all jobs that have not started yet. Jobs that are already running are not
   * interrupted, shutdown() waits for them to finish. Must not be called from within a job.
   */
  void shutdown();

  bool is_shut_down() const;

  size_t max_concurrency() const;
  size_t active_count() const;
  size_t queued_count() const;
  size_t worker_count() const;

 private:
  void _work();

  const size_t _max_concurrency;

  mutable std::mutex _mutex;
  std::condition_variable _condition;
  std::deque<Job> _queue;
  std::vector<std::thread> _workers;
  size_t _idle_workers{0};
  size_t _active_jobs{0};
  bool _shut_down{false};
};

}  // namespace cardex
