#pragma once

#include "tessera/graph/RangeSpec.hpp"
#include "tessera/graph/Shape.hpp"
#include "tessera/memory/container/span.hpp"
#include "tessera/memory/container/string.hpp"
#include "tessera/memory/container/vector.hpp"
#include "tessera/symbolic/SymGraphEval.hpp"
#include "tessera/symbolic/Symbolic.hpp"
#include <fmt/core.h>

namespace tessera::graph {

// Zero-copy view of a row-major storage buffer. Every physical axis holds its
// storage extent, the visible range [start, end) and whether it is a
// broadcast axis without storage. order() maps logical to physical axes.
class ShapeTracker {
public:
  ShapeTracker() = default;

  // Contiguous view of a buffer with the given extents.
  explicit ShapeTracker(memory::vector<Symbolic> extents);

  static ShapeTracker contiguous(const Shape &shape) {
    return ShapeTracker{shape.sizes()};
  }

  std::size_t rank() const { return m_order.size(); }

  memory::span<const std::size_t> order() const { return m_order; }

  const AxisRange &range(std::size_t axis) const {
    return m_ranges[m_order[axis]];
  }

  const Symbolic &extent(std::size_t axis) const {
    return m_extents[m_order[axis]];
  }

  bool isFake(std::size_t axis) const { return m_fake[m_order[axis]]; }

  // Logical extent of every axis.
  memory::vector<Symbolic> shape() const;

  Symbolic numel() const;

  bool isPermuted() const;
  bool isSliced() const;
  bool hasFakeAxes() const;
  bool isContiguous() const {
    return !isPermuted() && !isSliced() && !hasFakeAxes();
  }

  // Narrows a logical axis, the range is relative to the current view.
  ShapeTracker slice(std::size_t axis, const AxisRange &range) const;

  // Throws InvalidRange if perm is not a bijection over the axes.
  ShapeTracker permute(memory::span<const std::size_t> perm) const;

  // Inserts a broadcast axis at logical position axis.
  ShapeTracker expand(std::size_t axis, const Symbolic &size) const;

  // Turns an existing axis of extent 1 into a broadcast axis of size.
  ShapeTracker broadcast(std::size_t axis, const Symbolic &size) const;

  // Storage offset of a logical index.
  Symbolic indexOf(memory::span<const Symbolic> index) const;

  // Concrete logical extents, throws if a symbol is unbound.
  memory::vector<Sym::value_type> resolve(const SymGraphEval &eval) const;

  // Same view with every expression replaced by its value.
  ShapeTracker resolved(const SymGraphEval &eval) const;

  friend bool operator==(const ShapeTracker &lhs, const ShapeTracker &rhs);

  memory::string to_string() const;

private:
  memory::vector<Symbolic> m_extents;
  memory::vector<AxisRange> m_ranges;
  memory::vector<bool> m_fake;
  memory::vector<std::size_t> m_order;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ShapeTracker> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ShapeTracker &view,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", view.to_string());
  }
};
