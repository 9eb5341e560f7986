#pragma once

#include "tessera/memory/container/string.hpp"
#include "tessera/memory/hypergraph/NodeId.hpp"
#include "tessera/symbolic/Symbolic.hpp"

namespace tessera::graph {

// Two sizes that must be equal at run time but could not be proven equal
// while building the graph.
struct ShapeObligation {
  Symbolic lhs;
  Symbolic rhs;
  memory::NodeId node;
  memory::string context;
};

} // namespace tessera::graph
