#include "tessera/graph/functions.hpp"
#include "tessera/diag/errors.hpp"
#include <limits>

namespace tessera::graph {

static Sym::value_type axis_length(memory::span<const FunctionInput> inputs,
                                   std::size_t axis, memory::NodeId self) {
  if (inputs.size() != 1) {
    diag::function_payload_error("{}: expected one input, got {}", self,
                                 inputs.size());
  }
  const ShapeTracker &view = inputs[0].view.view;
  if (axis >= view.rank()) {
    diag::function_payload_error("{}: axis {} of a view of rank {}", self,
                                 axis, view.rank());
  }
  auto n = view.shape()[axis].tryConstant();
  if (!n.has_value()) {
    diag::function_payload_error("{}: length of axis {} is not resolved", self,
                                 axis);
  }
  return *n;
}

GraphTensor arange(Graph &graph, const GraphTensor &peer, std::size_t axis) {
  if (axis >= peer.rank()) {
    diag::invalid_range("arange over axis {} of a tensor of rank {}", axis,
                        peer.rank());
  }
  const GraphTensor inputs[] = {peer};
  return graph.function(
      "ARange", inputs, Shape{peer.shape()[axis]},
      [axis](memory::span<const FunctionInput> in,
             memory::NodeId self) -> FunctionResult {
        const Sym::value_type n = axis_length(in, axis, self);
        HostTensor out;
        out.data.reserve(static_cast<std::size_t>(n));
        for (Sym::value_type i = 0; i < n; ++i) {
          out.data.push_back(static_cast<float>(i));
        }
        ShapeTracker view(memory::vector<Symbolic>{n});
        return FunctionResult{std::move(out), TensorView{self, view}};
      });
}

GraphTensor causalMask(Graph &graph, const GraphTensor &peer,
                       std::size_t axis) {
  if (axis >= peer.rank()) {
    diag::invalid_range("causal mask over axis {} of a tensor of rank {}",
                        axis, peer.rank());
  }
  const Dim &dim = peer.shape()[axis];
  const GraphTensor inputs[] = {peer};
  return graph.function(
      "CausalMask", inputs, Shape{dim, dim},
      [axis](memory::span<const FunctionInput> in,
             memory::NodeId self) -> FunctionResult {
        const Sym::value_type n = axis_length(in, axis, self);
        HostTensor out;
        out.data.reserve(static_cast<std::size_t>(n * n));
        for (Sym::value_type i = 0; i < n; ++i) {
          for (Sym::value_type j = 0; j < n; ++j) {
            out.data.push_back(j > i ? -std::numeric_limits<float>::infinity()
                                     : 0.0f);
          }
        }
        ShapeTracker view(memory::vector<Symbolic>{n, n});
        return FunctionResult{std::move(out), TensorView{self, view}};
      });
}

} // namespace tessera::graph
