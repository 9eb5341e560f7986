#pragma once

#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace tessera::diag {

// Rank or build-time size disagreement between tensors.
class ShapeMismatch : public std::runtime_error {
public:
  explicit ShapeMismatch(const std::string &msg) : std::runtime_error(msg) {}
};

// Slice, permutation or reshape specification that is inconsistent with the
// tensor it is applied to.
class InvalidRange : public std::runtime_error {
public:
  explicit InvalidRange(const std::string &msg) : std::runtime_error(msg) {}
};

// Two run-time sizes that had to agree resolved to different values.
class UnresolvedDynamicMismatch : public std::runtime_error {
public:
  explicit UnresolvedDynamicMismatch(const std::string &msg)
      : std::runtime_error(msg) {}
};

// A function node payload failed or returned a view that contradicts its
// declared shape.
class FunctionPayloadError : public std::runtime_error {
public:
  explicit FunctionPayloadError(const std::string &msg)
      : std::runtime_error(msg) {}
};

template <typename... Args>
[[noreturn]] inline void shape_mismatch(fmt::format_string<Args...> fmt,
                                        Args &&...args) {
  throw ShapeMismatch(fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
[[noreturn]] inline void invalid_range(fmt::format_string<Args...> fmt,
                                       Args &&...args) {
  throw InvalidRange(fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
[[noreturn]] inline void
unresolved_dynamic_mismatch(fmt::format_string<Args...> fmt, Args &&...args) {
  throw UnresolvedDynamicMismatch(
      fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
[[noreturn]] inline void function_payload_error(fmt::format_string<Args...> fmt,
                                                Args &&...args) {
  throw FunctionPayloadError(fmt::format(fmt, std::forward<Args>(args)...));
}

} // namespace tessera::diag
