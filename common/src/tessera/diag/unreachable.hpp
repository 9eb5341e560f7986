#pragma once

#include <fmt/format.h>
#include <stdexcept>
#include <string>

namespace tessera::diag {

[[noreturn]] static inline void unreachable(const std::string &msg = {}) {
#ifndef NDEBUG
  if (msg.empty()) {
    throw std::logic_error("unreachable");
  } else {
    throw std::logic_error(fmt::format("unreachable: {}", msg));
  }
#else
#if defined(_MSC_VER) && !defined(__clang__) // MSVC
  __assume(false);
#else                                        // GCC, Clang
  __builtin_unreachable();
#endif
#endif
}

} // namespace tessera::diag
