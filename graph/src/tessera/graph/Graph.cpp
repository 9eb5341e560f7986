#include "tessera/graph/Graph.hpp"
#include "tessera/diag/errors.hpp"
#include "tessera/diag/invalid_argument.hpp"
#include "tessera/diag/logging.hpp"
#include <cassert>
#include <fmt/format.h>

namespace tessera::graph {

GraphTensor NodeBuilder::finish() {
  const std::size_t count = m_graph->nodeCount();
  for (const auto &id : m_inputs) {
    if (!id || id.index() >= count) {
      diag::invalid_argument(
          fmt::format("NodeBuilder: unknown input node {}", id));
    }
  }
  if (m_view.has_value()) {
    if (m_view->rank() != m_shape.rank()) {
      diag::shape_mismatch("NodeBuilder: view of rank {} for shape {}",
                           m_view->rank(), m_shape);
    }
    if (!m_storage || m_storage.index() >= count) {
      diag::invalid_argument(
          fmt::format("NodeBuilder: unknown storage node {}", m_storage));
    }
  }
  return m_graph->insert(std::move(m_op), std::move(m_inputs),
                         std::move(m_shape), std::move(m_view), m_storage);
}

Graph::Graph(Options options)
    : m_controlBlock(std::make_unique<details::GraphControlBlock>(options)) {
  if (options.logLevel.has_value()) {
    diag::set_log_level(*options.logLevel);
  }
}

Symbolic Graph::symbol(memory::string_view name) {
  return Symbolic(&m_controlBlock->symGraph, m_controlBlock->symGraph.var(name));
}

Dim Graph::dynamic(memory::string_view name) {
  return Dim::Dynamic(symbol(name));
}

GraphTensor Graph::newTensor(memory::string_view name, Shape shape) {
  for (const auto &named : namedTensors()) {
    if (named.name == name) {
      diag::invalid_argument(
          fmt::format("Graph: tensor name \"{}\" is already taken by {}", name,
                      named.tensor.id()));
    }
  }
  return insert(ComputeOpInput{memory::string(name)}, {}, std::move(shape),
                memory::nullopt, memory::NodeId{});
}

GraphTensor Graph::constant(float value) {
  return insert(ComputeOpConstant{value}, {}, Shape{}, memory::nullopt,
                memory::NodeId{});
}

GraphTensor Graph::insert(ComputeOp op, memory::vector<memory::NodeId> inputs,
                          Shape shape, memory::optional<ShapeTracker> view,
                          memory::NodeId storage,
                          memory::vector<ShapeObligation> obligations) {
  auto &cb = *m_controlBlock;
  const memory::NodeId id{cb.nodes.size()};
  ShapeTracker tracker =
      view.has_value() ? std::move(*view) : ShapeTracker::contiguous(shape);
  assert(tracker.rank() == shape.rank());
  if (!view.has_value() || !storage) {
    storage = id;
  }
  TESSERA_TRACE("{} = {}({}) : {}", id, op, fmt::join(inputs, ", "), shape);
  cb.nodes.push_back(ComputeNode{id, std::move(op), std::move(inputs), shape,
                                 std::move(tracker), storage});
  defer(id, std::move(obligations));
  return GraphTensor{id, std::move(shape)};
}

void Graph::defer(memory::NodeId node,
                  memory::vector<ShapeObligation> obligations) {
  for (auto &obligation : obligations) {
    obligation.node = node;
    TESSERA_DEBUG("{}: deferred check {} == {} ({})", node, obligation.lhs,
                  obligation.rhs, obligation.context);
    m_controlBlock->obligations.push_back(std::move(obligation));
  }
}

const ComputeNode &Graph::checked(const GraphTensor &tensor) const {
  const auto &node = this->node(tensor.id());
  if (node.shape.rank() != tensor.rank()) {
    diag::shape_mismatch("tensor {} has rank {} but its node has rank {}",
                         tensor.id(), tensor.rank(), node.shape.rank());
  }
  return node;
}

void Graph::requireEqual(const Dim &lhs, const Dim &rhs,
                         memory::vector<ShapeObligation> &pending,
                         memory::string_view context) const {
  if (lhs.size() == rhs.size()) {
    return;
  }
  if (lhs.tryConstant().has_value() && rhs.tryConstant().has_value()) {
    diag::shape_mismatch("{}: {} != {}", context, lhs, rhs);
  }
  if (m_controlBlock->options.recordObligations) {
    pending.push_back(ShapeObligation{lhs.size(), rhs.size(), memory::NodeId{},
                                      memory::string(context)});
  }
}

const ComputeNode &Graph::node(memory::NodeId id) const {
  if (!id || id.index() >= m_controlBlock->nodes.size()) {
    diag::invalid_argument(fmt::format("Graph: unknown node {}", id));
  }
  return m_controlBlock->nodes[id.index()];
}

GraphTensor Graph::tensor(memory::NodeId id) const {
  return GraphTensor{id, node(id).shape};
}

memory::vector<NamedTensor> Graph::namedTensors() const {
  memory::vector<NamedTensor> named;
  for (const auto &node : m_controlBlock->nodes) {
    if (node.op.tag() == ComputeOpKind::Input) {
      named.push_back(
          NamedTensor{node.op.input().name, GraphTensor{node.id, node.shape}});
    }
  }
  return named;
}

void Graph::checkObligations(const SymGraphEval &eval) const {
  for (const auto &obligation : m_controlBlock->obligations) {
    auto lhs = eval[obligation.lhs];
    auto rhs = eval[obligation.rhs];
    if (!lhs.has_value() || !rhs.has_value()) {
      continue;
    }
    if (*lhs != *rhs) {
      TESSERA_ERROR("{}: {} resolved to {} and {} resolved to {}",
                    obligation.node, obligation.lhs, *lhs, obligation.rhs,
                    *rhs);
      diag::unresolved_dynamic_mismatch(
          "{} at node {}: {} = {} but {} = {}", obligation.context,
          obligation.node, obligation.lhs, *lhs, obligation.rhs, *rhs);
    }
  }
}

TensorView Graph::resolveView(memory::NodeId id,
                              const SymGraphEval &eval) const {
  return TensorView{id, node(id).view.resolved(eval)};
}

} // namespace tessera::graph
