#pragma once

#include "tessera/memory/container/optional.hpp"
#include "tessera/memory/container/string.hpp"
#include "tessera/symbolic/Symbolic.hpp"
#include <fmt/core.h>

namespace tessera::graph {

enum class DimKind {
  Constant,
  Dynamic,
};

// Size of one axis, either fixed when the graph is built or only known at
// run time.
class Dim {
public:
  static Dim Constant(Sym::value_type n) {
    return Dim{DimKind::Constant, Symbolic(n)};
  }

  static Dim Dynamic(Symbolic size) { return Dim{DimKind::Dynamic, size}; }

  DimKind kind() const { return m_kind; }
  bool isConstant() const { return m_kind == DimKind::Constant; }
  bool isDynamic() const { return m_kind == DimKind::Dynamic; }

  const Symbolic &size() const { return m_size; }

  memory::optional<Sym::value_type> tryConstant() const {
    return m_size.tryConstant();
  }

  friend bool operator==(const Dim &lhs, const Dim &rhs) {
    return lhs.m_kind == rhs.m_kind && lhs.m_size == rhs.m_size;
  }

  memory::string to_string() const {
    if (m_kind == DimKind::Constant) {
      return m_size.to_string();
    }
    return fmt::format("dyn({})", m_size.to_string());
  }

private:
  Dim(DimKind kind, Symbolic size) : m_kind(kind), m_size(size) {}

  DimKind m_kind;
  Symbolic m_size;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::Dim> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::Dim &dim, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", dim.to_string());
  }
};
