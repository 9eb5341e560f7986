#pragma once

#include "tessera/graph/ShapeTracker.hpp"
#include "tessera/memory/container/optional.hpp"
#include "tessera/memory/container/span.hpp"
#include "tessera/memory/container/vector.hpp"
#include "tessera/memory/hypergraph/NodeId.hpp"
#include <functional>

namespace tessera::graph {

// Host-side data produced by a function node, row-major.
struct HostTensor {
  memory::vector<float> data;
};

struct TensorView {
  memory::NodeId id;
  ShapeTracker view;
};

// Input of a function node as seen by its payload, the view is resolved to
// concrete extents. data is null if the backend does not expose the values.
struct FunctionInput {
  memory::NodeId id;
  TensorView view;
  const HostTensor *data = nullptr;
};

struct FunctionResult {
  memory::optional<HostTensor> data;
  TensorView view;
};

// Must be a pure function of its inputs: repeated invocations with equal
// inputs return equal results.
using FunctionPayload = std::function<FunctionResult(
    memory::span<const FunctionInput> inputs, memory::NodeId self)>;

} // namespace tessera::graph
