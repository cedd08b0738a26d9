#pragma once

#include <stdexcept>
#include <string>

#include "boost/preprocessor/stringize.hpp"

/**
 * This file provides better assertions than the std cassert/assert.h - DebugAssert(condition, msg) and Fail(msg) can be
 * used to both harden code by programming by contract and document the invariants enforced in messages.
 *
 * --> Use DebugAssert() whenever a certain invariant must hold, as in
 *
 * int divide(int numerator, int denominator) {
 *   DebugAssert(denominator == 0, "Divisions by zero are not allowed");
 *   return numerator / denominator;
 * }
 *
 * --> Use Fail() whenever an illegal code path is taken. Especially useful for switch statements:
 *
 * void foo(int v) {
 *   switch(v) {
 *     case 0: //...
 *     case 3: //...
 *     case 17: //...
 *     default: Fail("Illegal parameter");
 * }
 *
 * --> Use Assert() whenever an invariant should be checked even in release builds, either because testing it is
 *     very cheap or the invariant is considered very important
 *
 * --> Use AssertInput() / FailInput() to check if user input (visibility expressions, config files, ...) is correct.
 *     These throw an InvalidInputException instead of a std::logic_error.
 */

namespace cardex {

class InvalidInputException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

namespace detail {

// We need this indirection so that we can throw exceptions from destructors without the compiler complaining. That is
// generally forbidden and might lead to std::terminate, but since we don't want to recover from Fail()s anyway, that
// is fine.
[[noreturn]] inline void fail(const std::string& msg) { throw std::logic_error(msg); }

inline std::string trim_source_file_path(const std::string& path) {
  const auto src_pos = path.find("/src/");
  if (src_pos == std::string::npos) return path;

  // "+ 1", since we want "src/lib/..." and not "/src/lib/..."
  return path.substr(src_pos + 1);
}

}  // namespace detail

#define Fail(msg)                                                                                             \
  cardex::detail::fail(cardex::detail::trim_source_file_path(__FILE__) + ":" BOOST_PP_STRINGIZE(__LINE__) " " + \
                       msg);                                                                                  \
  static_assert(true, "End call of macro with a semicolon")

#define Assert(expr, msg)         \
  if (!static_cast<bool>(expr)) { \
    Fail(msg);                    \
  }                               \
  static_assert(true, "End call of macro with a semicolon")

#define FailInput(msg) throw cardex::InvalidInputException(std::string("Invalid input error: ") + msg)

#define AssertInput(expr, msg)                                                       \
  if (!static_cast<bool>(expr)) {                                                    \
    throw cardex::InvalidInputException(std::string("Invalid input error: ") + msg); \
  }                                                                                  \
  static_assert(true, "End call of macro with a semicolon")

#if CARDEX_DEBUG
#define DebugAssert(expr, msg) Assert(expr, msg)
#else
#define DebugAssert(expr, msg)
#endif

}  // namespace cardex
