#pragma once

#include "tessera/graph/Dim.hpp"
#include "tessera/memory/container/optional.hpp"
#include "tessera/memory/container/span.hpp"
#include "tessera/memory/container/string.hpp"
#include "tessera/memory/container/vector.hpp"
#include "tessera/symbolic/SymGraphEval.hpp"
#include <fmt/core.h>
#include <cassert>
#include <initializer_list>

namespace tessera::graph {

bool isPermutation(memory::span<const std::size_t> perm);

class Shape {
public:
  Shape() = default;
  Shape(std::initializer_list<Dim> dims) : m_dims(dims) {}
  explicit Shape(memory::vector<Dim> dims) : m_dims(std::move(dims)) {}

  std::size_t rank() const { return m_dims.size(); }

  const Dim &operator[](std::size_t axis) const {
    assert(axis < m_dims.size());
    return m_dims[axis];
  }

  memory::span<const Dim> dims() const { return m_dims; }
  auto begin() const { return m_dims.begin(); }
  auto end() const { return m_dims.end(); }

  memory::vector<Symbolic> sizes() const;

  Symbolic numel() const;

  bool isConstant() const;

  // Throws InvalidRange if perm is not a bijection over the axes.
  Shape permute(memory::span<const std::size_t> perm) const;

  Shape with(std::size_t axis, Dim dim) const;
  Shape insert(std::size_t axis, Dim dim) const;
  Shape erase(std::size_t axis) const;

  // Concrete extents, nullopt if any extent depends on an unbound symbol.
  memory::optional<memory::vector<Sym::value_type>>
  resolve(const SymGraphEval &eval) const;

  friend bool operator==(const Shape &lhs, const Shape &rhs) {
    return lhs.m_dims == rhs.m_dims;
  }

  memory::string to_string() const;

private:
  memory::vector<Dim> m_dims;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::Shape> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::Shape &shape, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", shape.to_string());
  }
};
