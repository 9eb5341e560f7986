#pragma once

#include <cassert>
#include <concepts>
#include <cstdint>
#include <fmt/format.h>

namespace tessera {

class SymGraph;

// Either an integer literal or a reference to an expression of a SymGraph.
struct Sym {
  friend SymGraph;
  using value_type = std::int64_t;
  using symbol = std::uint64_t;

  bool isSymbolic() const { return !m_isConstant; }
  bool isConstant() const { return m_isConstant; }

  value_type constant() const {
    assert(m_isConstant);
    return m_constant;
  }

  symbol sym() const {
    assert(!m_isConstant);
    return m_sym;
  }

  friend bool operator==(const Sym &lhs, const Sym &rhs) {
    if (lhs.isConstant() != rhs.isConstant()) {
      return false;
    }
    if (lhs.isConstant()) {
      return lhs.constant() == rhs.constant();
    }
    return lhs.sym() == rhs.sym();
  }

  template <typename I>
    requires std::convertible_to<I, value_type>
  static Sym Const(I v) {
    return Sym{static_cast<value_type>(v)};
  }
  static Sym Symbol(symbol sym) { return Sym{sym}; }

  Sym() : m_isConstant(true), m_constant(0) {}

private:
  explicit Sym(value_type v) : m_isConstant(true), m_constant(v) {}
  explicit Sym(symbol sym) : m_isConstant(false), m_sym(sym) {}

  bool m_isConstant;
  union {
    std::uint64_t m_sym;
    std::int64_t m_constant;
  };
};

} // namespace tessera

template <> struct fmt::formatter<tessera::Sym> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::Sym &sym, FormatContext &ctx) const {
    if (sym.isConstant()) {
      return fmt::format_to(ctx.out(), "{}", sym.constant());
    }
    return fmt::format_to(ctx.out(), "[{}]", sym.sym());
  }
};
