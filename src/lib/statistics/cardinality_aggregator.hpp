#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "cardinality_aggregator_config.hpp"
#include "cardinality_cache.hpp"
#include "index_probe.hpp"
#include "ranked_cardinalities.hpp"
#include "scheduler/bounded_executor.hpp"
#include "store/abstract_cardinality_store.hpp"
#include "store/visibility.hpp"
#include "utils/interrupt_token.hpp"

namespace cardex {

/**
 * Resolves the cardinalities of a set of candidate index columns so that the planner can scan the index matching the
 * fewest rows.
 *
 * Every IndexProbe is resolved by one task, which fans out one task per column family of the probe. All tasks share
 * one BoundedExecutor, so nesting does not raise the concurrency limit. Exact (single value) ranges are resolved
 * through the shared CardinalityCache, all other ranges are summed up by the store directly.
 *
 * With early return enabled, the caller polls for finished columns every `polling_interval` and returns as soon as the
 * smallest known cardinality is at most `early_return_threshold`. Columns that are still being resolved keep running
 * in the background. They populate the cache and the cardinality of their IndexProbe, but the caller never sees their
 * result. Their failures are only logged.
 *
 * With early return disabled, the call blocks until all columns are resolved.
 */
class CardinalityAggregator final {
 public:
  CardinalityAggregator(const std::shared_ptr<const AbstractCardinalityStore>& store,
                        const CardinalityAggregatorConfig& config = {});
  ~CardinalityAggregator();

  CardinalityAggregator(const CardinalityAggregator&) = delete;
  CardinalityAggregator& operator=(const CardinalityAggregator&) = delete;

  /**
   * @param early_return_threshold  Largest cardinality that is small enough to stop waiting for other columns. Ignored
   *                                if early return is disabled.
   * @param polling_interval        Time to let the tasks run between two polls. Ignored if early return is disabled.
   * @param interrupt_token         Optional. Interrupting it makes the call fail with an InterruptedException cause;
   *                                the token stays interrupted.
   * @throws MissingTableException if the counter table does not exist
   * @throws CardinalityAggregationException if any awaited task failed or the call was interrupted
   */
  RankedCardinalities get_cardinalities(const std::string& schema, const std::string& table,
                                        const Authorizations& authorizations,
                                        const std::vector<std::shared_ptr<IndexProbe>>& probes,
                                        const Cardinality early_return_threshold,
                                        const std::chrono::milliseconds polling_interval,
                                        const bool early_return_enabled,
                                        const std::shared_ptr<const InterruptToken>& interrupt_token = nullptr);

  // Uses the polling interval and early return flag of the config
  RankedCardinalities get_cardinalities(const std::string& schema, const std::string& table,
                                        const Authorizations& authorizations,
                                        const std::vector<std::shared_ptr<IndexProbe>>& probes,
                                        const Cardinality early_return_threshold);

  /**
   * Stops all background work that has not started yet. Must not be called concurrently to get_cardinalities().
   */
  void shutdown();

  const CardinalityAggregatorConfig& config() const;
  const std::shared_ptr<CardinalityCache>& cache() const;
  const BoundedExecutor& executor() const;

  void set_log(const std::shared_ptr<std::ostream>& log);

 private:
  struct CompletionQueue;
  struct ColumnTask;

  // Granularity in which a blocking wait checks for interrupts
  static constexpr auto INTERRUPT_CHECK_INTERVAL = std::chrono::milliseconds{5};

  void _submit_column_task(const std::shared_ptr<ColumnTask>& column_task);
  void _finish_family(const std::shared_ptr<ColumnTask>& column_task);
  void _finish_column(const std::shared_ptr<ColumnTask>& column_task);
  Cardinality _get_family_cardinality(const std::string& schema, const std::string& table,
                                      const Authorizations& authorizations, const ByteString& family,
                                      const std::vector<ValueRange>& ranges);

  void _log_line(const std::string& line, const bool is_failure = false);

  const std::shared_ptr<const AbstractCardinalityStore> _store;
  const CardinalityAggregatorConfig _config;
  const std::shared_ptr<CardinalityCache> _cache;

  std::mutex _log_mutex;
  std::shared_ptr<std::ostream> _log;

  // Declared last so that it is destroyed first, its jobs use all other members
  BoundedExecutor _executor;
};

}  // namespace cardex
