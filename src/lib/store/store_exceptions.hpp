#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace cardex {

// I/O or connectivity failure while reaching the backing store. Not retried.
class StoreUnavailableException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The counter table does not exist. This is a configuration error and is never retried.
class MissingTableException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class TableExistsException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The thread waiting for cardinalities was interrupted
class InterruptedException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * The single error a caller of the CardinalityAggregator receives when any of the tasks it awaits failed. The
 * underlying errors are kept so that callers can rethrow and inspect them.
 */
class CardinalityAggregationException : public std::runtime_error {
 public:
  explicit CardinalityAggregationException(std::vector<std::exception_ptr> causes);

  const std::vector<std::exception_ptr>& causes() const;

  // Returns true if any of the causes is of type T
  template <typename T>
  bool has_cause() const {
    for (const auto& cause : _causes) {
      try {
        std::rethrow_exception(cause);
      } catch (const T&) {
        return true;
      } catch (...) {
        continue;
      }
    }
    return false;
  }

 private:
  static std::string _describe(const std::vector<std::exception_ptr>& causes);

  std::vector<std::exception_ptr> _causes;
};

}  // namespace cardex
