#pragma once

#include "tessera/graph/Shape.hpp"
#include "tessera/memory/hypergraph/NodeId.hpp"
#include <fmt/core.h>

namespace tessera::graph {

class Graph;

// Handle of a node output. Carries the shape the caller works with, all
// operations go through the owning Graph.
class GraphTensor {
public:
  friend Graph;

  GraphTensor() : m_id(), m_shape() {}

  memory::NodeId id() const { return m_id; }
  const Shape &shape() const { return m_shape; }
  std::size_t rank() const { return m_shape.rank(); }

private:
  GraphTensor(memory::NodeId id, Shape shape)
      : m_id(id), m_shape(std::move(shape)) {}

  memory::NodeId m_id;
  Shape m_shape;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::GraphTensor> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::GraphTensor &tensor,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}{}", tensor.id(), tensor.shape());
  }
};
