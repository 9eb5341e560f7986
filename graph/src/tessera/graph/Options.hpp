#pragma once

#include "tessera/diag/logging.hpp"
#include "tessera/memory/container/optional.hpp"
#include "tessera/symbolic/Sym.hpp"
#include <cstdint>
#include <limits>

namespace tessera::graph {

struct Options {
  // The logger is shared by every Graph in the process. Left unset, the level
  // currently in effect is kept.
  memory::optional<diag::LogLevel> logLevel;

  // End of a range without an upper bound when the axis size is unknown.
  // Graph slices always know their axis size, the sentinel is passed on to
  // resolveRange for callers that do not.
  Sym::value_type unboundedSentinel = std::numeric_limits<std::int32_t>::max();

  // Record size equalities that cannot be proven while building the graph,
  // such that they can be verified once the symbols are bound.
  bool recordObligations = true;
};

} // namespace tessera::graph
