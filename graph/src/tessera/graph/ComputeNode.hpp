#pragma once

#include "tessera/graph/ComputeOp.hpp"
#include "tessera/graph/Shape.hpp"
#include "tessera/graph/ShapeTracker.hpp"
#include "tessera/memory/container/vector.hpp"
#include "tessera/memory/hypergraph/NodeId.hpp"

namespace tessera::graph {

struct ComputeNode {
  memory::NodeId id;
  ComputeOp op;
  memory::vector<memory::NodeId> inputs;
  Shape shape;
  // View of the buffer owned by storage.
  ShapeTracker view;
  memory::NodeId storage;
};

} // namespace tessera::graph
