#include "bounded_executor.hpp"

#include <algorithm>
#include <utility>

#include "utils/assert.hpp"

namespace cardex {

size_t BoundedExecutor::default_max_concurrency() {
  // hardware_concurrency() may return 0 if the value is not computable
  return 4 * std::max(size_t{1}, static_cast<size_t>(std::thread::hardware_concurrency()));
}

BoundedExecutor::BoundedExecutor(const size_t max_concurrency) : _max_concurrency(max_concurrency) {
  Assert(_max_concurrency > 0, "BoundedExecutor needs to admit at least one job at a time");
}

BoundedExecutor::~BoundedExecutor() { shutdown(); }

void BoundedExecutor::submit(Job job) {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    Assert(!_shut_down, "Cannot submit jobs to a BoundedExecutor that was shut down");

    _queue.emplace_back(std::move(job));

    if (_queue.size() > _idle_workers && _workers.size() < _max_concurrency) {
      _workers.emplace_back([this]() { _work(); });
    }
  }
  _condition.notify_one();
}

void BoundedExecutor::shutdown() {
  auto workers = std::vector<std::thread>{};

  {
    std::lock_guard<std::mutex> lock(_mutex);
    _shut_down = true;
    _queue.clear();
    workers = std::move(_workers);
    _workers.clear();
  }
  _condition.notify_all();

  const auto this_thread_id = std::this_thread::get_id();
  for (auto& worker : workers) {
    Assert(worker.get_id() != this_thread_id, "BoundedExecutor cannot be shut down from one of its own jobs");
    worker.join();
  }
}

bool BoundedExecutor::is_shut_down() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _shut_down;
}

size_t BoundedExecutor::max_concurrency() const { return _max_concurrency; }

size_t BoundedExecutor::active_count() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _active_jobs;
}

size_t BoundedExecutor::queued_count() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _queue.size();
}

size_t BoundedExecutor::worker_count() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _workers.size();
}

void BoundedExecutor::_work() {
  while (true) {
    auto job = Job{};

    {
      std::unique_lock<std::mutex> lock(_mutex);

      ++_idle_workers;
      _condition.wait(lock, [&]() { return _shut_down || !_queue.empty(); });
      --_idle_workers;

      if (_shut_down) return;

      job = std::move(_queue.front());
      _queue.pop_front();
      ++_active_jobs;
    }

    job();

    {
      std::lock_guard<std::mutex> lock(_mutex);
      --_active_jobs;
    }
  }
}

}  // namespace cardex
