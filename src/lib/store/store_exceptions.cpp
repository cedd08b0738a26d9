#include "store_exceptions.hpp"

#include <sstream>
#include <utility>

namespace cardex {

CardinalityAggregationException::CardinalityAggregationException(std::vector<std::exception_ptr> causes)
    : std::runtime_error(_describe(causes)), _causes(std::move(causes)) {}

const std::vector<std::exception_ptr>& CardinalityAggregationException::causes() const { return _causes; }

std::string CardinalityAggregationException::_describe(const std::vector<std::exception_ptr>& causes) {
  std::stringstream stream;
  stream << "Exception when getting cardinality (" << causes.size() << " failed task(s))";

  for (const auto& cause : causes) {
    try {
      std::rethrow_exception(cause);
    } catch (const std::exception& exception) {
      stream << "; " << exception.what();
    } catch (...) {
      stream << "; unknown error";
    }
  }

  return stream.str();
}

}  // namespace cardex
