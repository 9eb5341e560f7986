#pragma once

#include "tessera/symbolic/Sym.hpp"
#include <cassert>
#include <cstddef>
#include <fmt/core.h>

namespace tessera::graph {

// Target axis of a reshape: either a literal size or the size of an axis of
// the reshaped tensor.
class ReshapeDim {
public:
  enum class Kind {
    Const,
    PrevDim,
  };

  static ReshapeDim Const(Sym::value_type n) {
    return ReshapeDim{Kind::Const, n, 0};
  }

  static ReshapeDim PrevDim(std::size_t axis) {
    return ReshapeDim{Kind::PrevDim, 0, axis};
  }

  Kind kind() const { return m_kind; }

  Sym::value_type constant() const {
    assert(m_kind == Kind::Const);
    return m_constant;
  }

  std::size_t prevDim() const {
    assert(m_kind == Kind::PrevDim);
    return m_axis;
  }

private:
  ReshapeDim(Kind kind, Sym::value_type constant, std::size_t axis)
      : m_kind(kind), m_constant(constant), m_axis(axis) {}

  Kind m_kind;
  Sym::value_type m_constant;
  std::size_t m_axis;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ReshapeDim> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ReshapeDim &dim, FormatContext &ctx) const {
    if (dim.kind() == tessera::graph::ReshapeDim::Kind::Const) {
      return fmt::format_to(ctx.out(), "{}", dim.constant());
    }
    return fmt::format_to(ctx.out(), "prev({})", dim.prevDim());
  }
};
