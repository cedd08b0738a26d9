#include "cardinality_aggregator.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

#include "store/store_exceptions.hpp"
#include "utils/assert.hpp"
#include "utils/timer.hpp"

namespace cardex {

/**
 * Channel from the column tasks to the call that spawned them. Once the call returned, it abandons the queue and
 * results are no longer delivered.
 */
struct CardinalityAggregator::CompletionQueue {
  struct Result {
    std::shared_ptr<IndexProbe> probe;
    Cardinality cardinality{0};
    std::vector<std::exception_ptr> errors;
  };

  // Returns false if nobody is listening anymore
  bool push(Result result) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (abandoned) return false;
      results.emplace_back(std::move(result));
    }
    condition.notify_all();
    return true;
  }

  std::vector<Result> drain() {
    std::lock_guard<std::mutex> lock(mutex);
    auto drained = std::vector<Result>{};
    drained.swap(results);
    return drained;
  }

  void wait_for(const std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex);
    condition.wait_for(lock, duration, [&]() { return !results.empty(); });
  }

  void abandon() {
    std::lock_guard<std::mutex> lock(mutex);
    abandoned = true;
  }

  std::mutex mutex;
  std::condition_variable condition;
  std::vector<Result> results;
  bool abandoned{false};
};

struct CardinalityAggregator::ColumnTask {
  ColumnTask(std::shared_ptr<IndexProbe> init_probe, const std::string& init_schema, const std::string& init_table,
             const Authorizations& init_authorizations, std::shared_ptr<CompletionQueue> init_completion_queue)
      : probe(std::move(init_probe)),
        schema(init_schema),
        table(init_table),
        authorizations(init_authorizations),
        completion_queue(std::move(init_completion_queue)) {}

  void add_error(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(error_mutex);
    errors.emplace_back(std::move(error));
  }

  const std::shared_ptr<IndexProbe> probe;
  const std::string schema;
  const std::string table;
  const Authorizations authorizations;
  const std::shared_ptr<CompletionQueue> completion_queue;

  std::atomic<size_t> remaining_families{0};
  std::atomic<Cardinality> cardinality{0};

  std::mutex error_mutex;
  std::vector<std::exception_ptr> errors;

  Timer timer;
};

CardinalityAggregator::CardinalityAggregator(const std::shared_ptr<const AbstractCardinalityStore>& store,
                                             const CardinalityAggregatorConfig& config)
    : _store(store),
      _config(config),
      _cache(std::make_shared<CardinalityCache>(store, config.cache_max_entries, config.cache_max_age)),
      _executor(config.max_concurrency) {
  std::stringstream stream;
  stream << "Created CardinalityAggregator with cache size " << _config.cache_max_entries << ", expiry "
         << _config.cache_max_age.count() << " ms and " << _config.max_concurrency << " concurrent tasks";
  _log_line(stream.str());
}

CardinalityAggregator::~CardinalityAggregator() { shutdown(); }

RankedCardinalities CardinalityAggregator::get_cardinalities(const std::string& schema, const std::string& table,
                                                             const Authorizations& authorizations,
                                                             const std::vector<std::shared_ptr<IndexProbe>>& probes,
                                                             const Cardinality early_return_threshold) {
  return get_cardinalities(schema, table, authorizations, probes, early_return_threshold, _config.polling_interval,
                           _config.early_return_enabled);
}

RankedCardinalities CardinalityAggregator::get_cardinalities(
    const std::string& schema, const std::string& table, const Authorizations& authorizations,
    const std::vector<std::shared_ptr<IndexProbe>>& probes, const Cardinality early_return_threshold,
    const std::chrono::milliseconds polling_interval, const bool early_return_enabled,
    const std::shared_ptr<const InterruptToken>& interrupt_token) {
  if (probes.empty()) return {};

  if (!_store->table_exists(schema, table)) {
    throw MissingTableException("Metrics table " + schema + "." + table + " does not exist");
  }

  // Without early return, we do not sleep but wait for the next column to finish
  const auto effective_polling_interval = early_return_enabled ? polling_interval : std::chrono::milliseconds{0};

  const auto completion_queue = std::make_shared<CompletionQueue>();

  // Whichever way this call is left, tasks that are still running must not deliver to it anymore
  struct QueueAbandoner {
    ~QueueAbandoner() { queue->abandon(); }
    const std::shared_ptr<CompletionQueue> queue;
  } queue_abandoner{completion_queue};

  for (const auto& probe : probes) {
    Assert(probe, "IndexProbe must not be null");
    _submit_column_task(std::make_shared<ColumnTask>(probe, schema, table, authorizations, completion_queue));
  }

  auto ranked_cardinalities = RankedCardinalities{};
  auto errors = std::vector<std::exception_ptr>{};
  auto received_count = size_t{0};

  while (received_count < probes.size()) {
    auto interrupted = false;
    if (effective_polling_interval.count() > 0) {
      // Let the tasks run for the polling interval
      if (interrupt_token) {
        interrupted = interrupt_token->sleep_for(effective_polling_interval);
      } else {
        std::this_thread::sleep_for(effective_polling_interval);
      }
    } else {
      completion_queue->wait_for(INTERRUPT_CHECK_INTERVAL);
      interrupted = interrupt_token && interrupt_token->is_interrupted();
    }

    if (interrupted) {
      errors.emplace_back(std::make_exception_ptr(
          InterruptedException("Interrupted while waiting for cardinalities of " + schema + "." + table)));
      break;
    }

    for (auto& result : completion_queue->drain()) {
      ++received_count;

      if (!result.errors.empty()) {
        errors.insert(errors.end(), result.errors.begin(), result.errors.end());
        continue;
      }

      ranked_cardinalities.add(result.cardinality, result.probe);
    }

    if (!errors.empty()) break;

    if (received_count < probes.size() && _executor.is_shut_down()) {
      errors.emplace_back(
          std::make_exception_ptr(std::logic_error("CardinalityAggregator was shut down while resolving " + schema +
                                                   "." + table)));
      break;
    }

    const auto smallest_cardinality = ranked_cardinalities.smallest_cardinality();
    if (early_return_enabled && smallest_cardinality && *smallest_cardinality <= early_return_threshold) {
      std::stringstream stream;
      stream << "Cardinality for column " << ranked_cardinalities.smallest().front()->column()
             << " is below threshold of " << early_return_threshold << ". Returning early while "
             << probes.size() - received_count << " other task(s) finish";
      _log_line(stream.str());
      break;
    }
  }

  if (!errors.empty()) {
    // A missing table is a configuration error and is reported as such
    for (const auto& error : errors) {
      try {
        std::rethrow_exception(error);
      } catch (const MissingTableException&) {
        throw;
      } catch (...) {
        // Reported as part of the CardinalityAggregationException below
      }
    }

    throw CardinalityAggregationException(std::move(errors));
  }

  return ranked_cardinalities;
}

void CardinalityAggregator::shutdown() { _executor.shutdown(); }

const CardinalityAggregatorConfig& CardinalityAggregator::config() const { return _config; }

const std::shared_ptr<CardinalityCache>& CardinalityAggregator::cache() const { return _cache; }

const BoundedExecutor& CardinalityAggregator::executor() const { return _executor; }

void CardinalityAggregator::set_log(const std::shared_ptr<std::ostream>& log) {
  std::lock_guard<std::mutex> lock(_log_mutex);
  _log = log;
}

void CardinalityAggregator::_submit_column_task(const std::shared_ptr<ColumnTask>& column_task) {
  _executor.submit([this, column_task]() {
    const auto& ranges_by_family = column_task->probe->ranges_by_family();

    if (ranges_by_family.empty()) {
      _finish_column(column_task);
      return;
    }

    // Set before the first family task is submitted, as that one might finish right away
    column_task->remaining_families = ranges_by_family.size();

    for (const auto& family_and_ranges : ranges_by_family) {
      const auto family = family_and_ranges.first;
      const auto ranges = family_and_ranges.second;

      try {
        _executor.submit([this, column_task, family, ranges]() {
          try {
            column_task->cardinality += _get_family_cardinality(column_task->schema, column_task->table,
                                                                column_task->authorizations, family, ranges);
          } catch (...) {
            column_task->add_error(std::current_exception());
          }
          _finish_family(column_task);
        });
      } catch (const std::logic_error&) {
        // The executor was shut down
        column_task->add_error(std::current_exception());
        _finish_family(column_task);
      }
    }
  });
}

void CardinalityAggregator::_finish_family(const std::shared_ptr<ColumnTask>& column_task) {
  // The last family task to finish completes the column
  if (--column_task->remaining_families > 0) return;
  _finish_column(column_task);
}

void CardinalityAggregator::_finish_column(const std::shared_ptr<ColumnTask>& column_task) {
  auto result = CompletionQueue::Result{};
  result.probe = column_task->probe;
  result.cardinality = column_task->cardinality.load();
  {
    std::lock_guard<std::mutex> lock(column_task->error_mutex);
    result.errors = column_task->errors;
  }

  const auto& column = column_task->probe->column();

  if (result.errors.empty()) {
    column_task->probe->set_cardinality(result.cardinality);

    std::stringstream stream;
    stream << "Cardinality for column " << column << " is " << result.cardinality << ", took "
           << column_task->timer.lap().count() / 1000 << " ms";
    _log_line(stream.str());
  }

  const auto errors = result.errors;
  const auto delivered = column_task->completion_queue->push(std::move(result));
  if (delivered) return;

  // Nobody is waiting for this column anymore
  for (const auto& error : errors) {
    try {
      std::rethrow_exception(error);
    } catch (const std::exception& exception) {
      _log_line("Background cardinality task for column " + column + " failed: " + exception.what(), true);
    } catch (...) {
      _log_line("Background cardinality task for column " + column + " failed with an unknown error", true);
    }
  }
}

Cardinality CardinalityAggregator::_get_family_cardinality(const std::string& schema, const std::string& table,
                                                           const Authorizations& authorizations,
                                                           const ByteString& family,
                                                           const std::vector<ValueRange>& ranges) {
  auto exact_keys = std::vector<CacheKey>{};
  auto non_exact_keys = std::vector<CacheKey>{};

  for (const auto& range : ranges) {
    auto key = CacheKey{schema, table, family, authorizations, range};
    if (range.is_exact()) {
      exact_keys.emplace_back(std::move(key));
    } else {
      non_exact_keys.emplace_back(std::move(key));
    }
  }

  auto sum = Cardinality{0};

  // This is where the store is reached for all exact values that are not cached yet
  if (exact_keys.size() == 1) {
    sum += _cache->get_cardinality(exact_keys.front());
  } else if (!exact_keys.empty()) {
    for (const auto& [key, cardinality] : _cache->get_cardinalities(exact_keys)) {
      sum += cardinality;
    }
  }

  // Ranges over many values are cheap to sum up in the store and not worth caching
  if (!non_exact_keys.empty()) {
    sum += _store->get_cardinality(non_exact_keys);
  }

  return sum;
}

void CardinalityAggregator::_log_line(const std::string& line, const bool is_failure) {
  std::lock_guard<std::mutex> lock(_log_mutex);
  if (_log) {
    (*_log) << "CardinalityAggregator: " << line << std::endl;
  } else if (is_failure) {
    std::cerr << "CardinalityAggregator: " << line << std::endl;
  }
}

}  // namespace cardex
