#pragma once

#include "tessera/graph/ComputeNode.hpp"
#include "tessera/graph/Options.hpp"
#include "tessera/graph/ShapeObligation.hpp"
#include "tessera/memory/container/vector.hpp"
#include "tessera/symbolic/SymGraph.hpp"

namespace tessera::graph::details {

// Heap-allocated such that Symbolic values keep a stable SymGraph pointer
// when the owning Graph is moved.
struct GraphControlBlock {
  explicit GraphControlBlock(Options options) : options(options) {}

  Options options;
  SymGraph symGraph;
  memory::vector<ComputeNode> nodes;
  memory::vector<ShapeObligation> obligations;
};

} // namespace tessera::graph::details
