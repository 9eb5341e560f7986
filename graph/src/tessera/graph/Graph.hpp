#pragma once

#include "tessera/graph/ComputeNode.hpp"
#include "tessera/graph/ComputeOp.hpp"
#include "tessera/graph/Dim.hpp"
#include "tessera/graph/GraphControlBlock.hpp"
#include "tessera/graph/GraphTensor.hpp"
#include "tessera/graph/Options.hpp"
#include "tessera/graph/RangeSpec.hpp"
#include "tessera/graph/ReshapeDim.hpp"
#include "tessera/graph/Shape.hpp"
#include "tessera/graph/ShapeObligation.hpp"
#include "tessera/graph/ShapeTracker.hpp"
#include "tessera/graph/TensorView.hpp"
#include "tessera/memory/container/optional.hpp"
#include "tessera/memory/container/span.hpp"
#include "tessera/memory/container/string.hpp"
#include "tessera/memory/container/string_view.hpp"
#include "tessera/memory/container/vector.hpp"
#include "tessera/memory/hypergraph/NodeId.hpp"
#include "tessera/symbolic/SymGraph.hpp"
#include "tessera/symbolic/SymGraphEval.hpp"
#include "tessera/symbolic/Symbolic.hpp"
#include <fmt/core.h>
#include <initializer_list>
#include <memory>

namespace tessera::graph {

class Graph;

// Collects the input edges of a node before it is appended to the graph.
class NodeBuilder {
public:
  friend Graph;

  NodeBuilder &input(memory::NodeId id) {
    m_inputs.push_back(id);
    return *this;
  }

  NodeBuilder &input(const GraphTensor &tensor) { return input(tensor.id()); }

  // Output is a view of the buffer owned by storage instead of a fresh
  // contiguous buffer.
  NodeBuilder &view(ShapeTracker view, memory::NodeId storage) {
    m_view = std::move(view);
    m_storage = storage;
    return *this;
  }

  GraphTensor finish();

private:
  NodeBuilder(Graph *graph, ComputeOp op, Shape shape)
      : m_graph(graph), m_op(std::move(op)), m_shape(std::move(shape)) {}

  Graph *m_graph;
  ComputeOp m_op;
  Shape m_shape;
  memory::vector<memory::NodeId> m_inputs;
  memory::optional<ShapeTracker> m_view;
  memory::NodeId m_storage;
};

struct NamedTensor {
  memory::string name;
  GraphTensor tensor;
};

// Append-only arena of compute nodes. Every operation validates its inputs
// before the first node is appended, a throwing operation leaves the graph
// unchanged.
class Graph {
public:
  friend NodeBuilder;

  explicit Graph(Options options = {});

  Graph(const Graph &) = delete;
  Graph &operator=(const Graph &) = delete;
  Graph(Graph &&) noexcept = default;
  Graph &operator=(Graph &&) noexcept = default;

  // Named run-time symbol.
  Symbolic symbol(memory::string_view name);
  // Dynamic dimension backed by a named run-time symbol.
  Dim dynamic(memory::string_view name);

  GraphTensor newTensor(memory::string_view name, Shape shape);
  GraphTensor input(memory::string_view name, Shape shape) {
    return newTensor(name, std::move(shape));
  }
  GraphTensor constant(float value);

  NodeBuilder addOp(ComputeOp op, Shape declaredShape) {
    return NodeBuilder{this, std::move(op), std::move(declaredShape)};
  }

  // Views.
  GraphTensor slice(const GraphTensor &src, memory::span<const RangeSpec> ranges);
  GraphTensor slice(const GraphTensor &src,
                    std::initializer_list<RangeSpec> ranges) {
    return slice(src, memory::span<const RangeSpec>(ranges.begin(),
                                                    ranges.size()));
  }
  GraphTensor sliceAxis(const GraphTensor &src, std::size_t axis,
                        const RangeSpec &range);

  GraphTensor permute(const GraphTensor &src,
                      memory::span<const std::size_t> perm);
  GraphTensor permute(const GraphTensor &src,
                      std::initializer_list<std::size_t> perm) {
    return permute(src,
                   memory::span<const std::size_t>(perm.begin(), perm.size()));
  }

  // Inserts a broadcast axis of size dim at position axis.
  GraphTensor expand(const GraphTensor &src, std::size_t axis, const Dim &dim);
  // Right-aligned broadcast to target.
  GraphTensor expandTo(const GraphTensor &src, const Shape &target);

  GraphTensor reshape(const GraphTensor &src,
                      memory::span<const ReshapeDim> dims);
  GraphTensor reshape(const GraphTensor &src,
                      std::initializer_list<ReshapeDim> dims) {
    return reshape(src,
                   memory::span<const ReshapeDim>(dims.begin(), dims.size()));
  }

  GraphTensor contiguous(const GraphTensor &src);

  GraphTensor concat(memory::span<const GraphTensor> srcs, std::size_t axis);
  GraphTensor concat(const GraphTensor &a, const GraphTensor &b,
                     std::size_t axis) {
    const GraphTensor srcs[] = {a, b};
    return concat(memory::span<const GraphTensor>(srcs), axis);
  }

  // Relabels the shape of a handle without touching its node.
  GraphTensor realize(const GraphTensor &src, const Shape &shape);

  // Elementwise.
  GraphTensor unary(const GraphTensor &src, UnaryOp op);
  GraphTensor neg(const GraphTensor &src) { return unary(src, UnaryOp::Neg); }
  GraphTensor exp(const GraphTensor &src) { return unary(src, UnaryOp::Exp); }
  GraphTensor log(const GraphTensor &src) { return unary(src, UnaryOp::Log); }
  GraphTensor sin(const GraphTensor &src) { return unary(src, UnaryOp::Sin); }
  GraphTensor cos(const GraphTensor &src) { return unary(src, UnaryOp::Cos); }
  GraphTensor sqrt(const GraphTensor &src) {
    return unary(src, UnaryOp::Sqrt);
  }
  GraphTensor recip(const GraphTensor &src) {
    return unary(src, UnaryOp::Recip);
  }

  GraphTensor binary(const GraphTensor &lhs, const GraphTensor &rhs,
                     BinaryOp op);
  GraphTensor add(const GraphTensor &lhs, const GraphTensor &rhs) {
    return binary(lhs, rhs, BinaryOp::Add);
  }
  GraphTensor sub(const GraphTensor &lhs, const GraphTensor &rhs) {
    return binary(lhs, rhs, BinaryOp::Sub);
  }
  GraphTensor mul(const GraphTensor &lhs, const GraphTensor &rhs) {
    return binary(lhs, rhs, BinaryOp::Mul);
  }
  GraphTensor div(const GraphTensor &lhs, const GraphTensor &rhs) {
    return binary(lhs, rhs, BinaryOp::Div);
  }
  GraphTensor max(const GraphTensor &lhs, const GraphTensor &rhs) {
    return binary(lhs, rhs, BinaryOp::Max);
  }

  // Reductions remove the reduced axis.
  GraphTensor reduce(const GraphTensor &src, std::size_t axis, ReduceOp op);
  GraphTensor sumReduce(const GraphTensor &src, std::size_t axis) {
    return reduce(src, axis, ReduceOp::Sum);
  }
  GraphTensor maxReduce(const GraphTensor &src, std::size_t axis) {
    return reduce(src, axis, ReduceOp::Max);
  }

  GraphTensor matmul(const GraphTensor &lhs, const GraphTensor &rhs);

  // Softmax along axis, composed from primitives.
  GraphTensor softmax(const GraphTensor &src, std::size_t axis);

  GraphTensor function(memory::string_view name,
                       memory::span<const GraphTensor> inputs,
                       Shape declaredShape, FunctionPayload payload);

  // Runs the payload of a function node and checks the returned view against
  // the declared shape. Throws FunctionPayloadError.
  FunctionResult invokeFunction(memory::NodeId id,
                                memory::span<const FunctionInput> inputs) const;

  const ComputeNode &node(memory::NodeId id) const;
  memory::span<const ComputeNode> nodes() const {
    return m_controlBlock->nodes;
  }
  std::size_t nodeCount() const { return m_controlBlock->nodes.size(); }

  // Handle of a node with its declared shape.
  GraphTensor tensor(memory::NodeId id) const;

  memory::vector<NamedTensor> namedTensors() const;

  memory::span<const ShapeObligation> obligations() const {
    return m_controlBlock->obligations;
  }

  SymGraphEval eval(memory::span<const NamedSymSpec> bindings) const {
    return m_controlBlock->symGraph.eval(bindings);
  }
  SymGraphEval eval(std::initializer_list<NamedSymSpec> bindings) const {
    return eval(memory::span<const NamedSymSpec>(bindings.begin(),
                                                 bindings.size()));
  }

  // Throws UnresolvedDynamicMismatch for the first recorded obligation whose
  // sides resolve to different values.
  void checkObligations(const SymGraphEval &eval) const;

  TensorView resolveView(memory::NodeId id, const SymGraphEval &eval) const;

  const SymGraph &symGraph() const { return m_controlBlock->symGraph; }
  SymGraph &symGraph() { return m_controlBlock->symGraph; }

  const Options &options() const { return m_controlBlock->options; }

  memory::string to_string() const;

private:
  GraphTensor insert(ComputeOp op, memory::vector<memory::NodeId> inputs,
                     Shape shape, memory::optional<ShapeTracker> view,
                     memory::NodeId storage,
                     memory::vector<ShapeObligation> obligations = {});

  // Attributes the obligations to node and records them.
  void defer(memory::NodeId node, memory::vector<ShapeObligation> obligations);

  const ComputeNode &checked(const GraphTensor &tensor) const;

  // Literal disagreement throws ShapeMismatch, unprovable equality is
  // appended to pending.
  void requireEqual(const Dim &lhs, const Dim &rhs,
                    memory::vector<ShapeObligation> &pending,
                    memory::string_view context) const;

  std::unique_ptr<details::GraphControlBlock> m_controlBlock;
};

} // namespace tessera::graph

template <>
struct fmt::formatter<tessera::graph::Graph>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const tessera::graph::Graph &graph, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(graph.to_string(), ctx);
  }
};
