#pragma once

#include <stdexcept>
#include <string>

namespace tessera::diag {

[[noreturn]] inline void invalid_argument() {
  throw std::invalid_argument("invalid_argument");
}

[[noreturn]] inline void invalid_argument(const std::string &msg) {
  throw std::invalid_argument(msg);
}

} // namespace tessera::diag
