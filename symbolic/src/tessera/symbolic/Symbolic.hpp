#pragma once

#include "tessera/memory/container/optional.hpp"
#include "tessera/memory/container/string.hpp"
#include "tessera/diag/invalid_argument.hpp"
#include "tessera/symbolic/SymGraph.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace tessera {

// Value handle of an expression: a Sym together with the SymGraph it lives
// in. Literals do not require a graph.
class Symbolic {
public:
  explicit Symbolic(SymGraph *graph, Sym self)
      : m_symGraph(graph), m_self(self) {
    if (self.isSymbolic()) {
      assert(graph != nullptr);
    }
  }

  Symbolic(Sym::value_type v) : m_symGraph(nullptr), m_self(Sym::Const(v)) {}

  Symbolic() : m_symGraph(nullptr), m_self(Sym::Const(0)) {}

  friend Symbolic operator+(const Symbolic &a, const Symbolic &b) {
    if (a.m_self.isConstant() && b.m_self.isConstant()) {
      return constBinaryOp(a, b, a.m_self.constant() + b.m_self.constant());
    }
    SymGraph *symGraph = selectSymGraph(a, b);
    assert(symGraph != nullptr);
    return Symbolic(symGraph, symGraph->add(a.m_self, b.m_self));
  }

  friend Symbolic operator+(const Symbolic &a, Sym::value_type b) {
    if (a.m_self.isConstant()) {
      return constBinaryOp(a, a.m_self.constant() + b);
    }
    return Symbolic(a.m_symGraph, a.m_symGraph->add(a.m_self, b));
  }

  friend Symbolic operator+(Sym::value_type a, const Symbolic &b) {
    return b + a;
  }

  friend Symbolic operator-(const Symbolic &a, const Symbolic &b) {
    if (a.m_self.isConstant() && b.m_self.isConstant()) {
      return constBinaryOp(a, b, a.m_self.constant() - b.m_self.constant());
    }
    SymGraph *symGraph = selectSymGraph(a, b);
    assert(symGraph != nullptr);
    return Symbolic(symGraph, symGraph->sub(a.m_self, b.m_self));
  }

  friend Symbolic operator-(const Symbolic &a, Sym::value_type b) {
    if (a.m_self.isConstant()) {
      return constBinaryOp(a, a.m_self.constant() - b);
    }
    return Symbolic(a.m_symGraph, a.m_symGraph->sub(a.m_self, b));
  }

  friend Symbolic operator-(Sym::value_type a, const Symbolic &b) {
    if (b.m_self.isConstant()) {
      return constBinaryOp(b, a - b.m_self.constant());
    }
    return Symbolic(b.m_symGraph, b.m_symGraph->sub(a, b.m_self));
  }

  friend Symbolic operator*(const Symbolic &a, const Symbolic &b) {
    if (a.m_self.isConstant() && b.m_self.isConstant()) {
      return constBinaryOp(a, b, a.m_self.constant() * b.m_self.constant());
    }
    SymGraph *symGraph = selectSymGraph(a, b);
    assert(symGraph != nullptr);
    return Symbolic(symGraph, symGraph->mul(a.m_self, b.m_self));
  }

  friend Symbolic operator*(const Symbolic &a, Sym::value_type b) {
    if (a.m_self.isConstant()) {
      return constBinaryOp(a, a.m_self.constant() * b);
    }
    return Symbolic(a.m_symGraph, a.m_symGraph->mul(a.m_self, b));
  }

  friend Symbolic operator*(Sym::value_type a, const Symbolic &b) {
    return b * a;
  }

  // Floor division, a zero divisor throws.
  friend Symbolic operator/(const Symbolic &a, const Symbolic &b) {
    if (a.m_self.isConstant() && b.m_self.isConstant()) {
      if (b.m_self.constant() == 0) {
        diag::invalid_argument("Symbolic: division by zero");
      }
      return constBinaryOp(
          a, b, SymGraph::floordivmod(a.m_self.constant(), b.m_self.constant())
                    .first);
    }
    SymGraph *symGraph = selectSymGraph(a, b);
    assert(symGraph != nullptr);
    return Symbolic(symGraph, symGraph->div(a.m_self, b.m_self));
  }

  friend Symbolic operator%(const Symbolic &a, const Symbolic &b) {
    if (a.m_self.isConstant() && b.m_self.isConstant()) {
      if (b.m_self.constant() == 0) {
        diag::invalid_argument("Symbolic: modulo by zero");
      }
      return constBinaryOp(
          a, b, SymGraph::emod(a.m_self.constant(), b.m_self.constant()));
    }
    SymGraph *symGraph = selectSymGraph(a, b);
    assert(symGraph != nullptr);
    return Symbolic(symGraph, symGraph->mod(a.m_self, b.m_self));
  }

  friend Symbolic min(const Symbolic &a, const Symbolic &b) {
    if (a.m_self.isConstant() && b.m_self.isConstant()) {
      return constBinaryOp(a, b, std::min(a.m_self.constant(),
                                          b.m_self.constant()));
    }
    SymGraph *symGraph = selectSymGraph(a, b);
    assert(symGraph != nullptr);
    return Symbolic(symGraph, symGraph->min(a.m_self, b.m_self));
  }

  friend Symbolic max(const Symbolic &a, const Symbolic &b) {
    if (a.m_self.isConstant() && b.m_self.isConstant()) {
      return constBinaryOp(a, b, std::max(a.m_self.constant(),
                                          b.m_self.constant()));
    }
    SymGraph *symGraph = selectSymGraph(a, b);
    assert(symGraph != nullptr);
    return Symbolic(symGraph, symGraph->max(a.m_self, b.m_self));
  }

  const Sym &operator*() const { return m_self; }

  operator Sym() const { return m_self; }

  // Structural equality, expressions are hash-consed.
  friend bool operator==(const Symbolic &a, const Symbolic &b) {
    return a.resolve() == b.resolve();
  }

  friend bool operator==(const Symbolic &a, Sym::value_type b) {
    return a.resolve() == Sym::Const(b);
  }

  Sym resolve() const {
    if (m_symGraph != nullptr) {
      return m_symGraph->resolve(m_self);
    }
    return m_self;
  }

  bool isSymbolic() const { return resolve().isSymbolic(); }

  bool isConstant() const { return resolve().isConstant(); }

  Sym::value_type constant() const { return resolve().constant(); }

  memory::optional<Sym::value_type> tryConstant() const {
    Sym s = resolve();
    if (s.isConstant()) {
      return s.constant();
    }
    return memory::nullopt;
  }

  memory::string to_string() const {
    if (m_symGraph == nullptr) {
      return fmt::format("{}", m_self);
    }
    return m_symGraph->to_string(m_self);
  }

  // NOTE: This can definitely be nullptr!
  // Symbolics, which hold a constant, do not strictly need to hold a valid
  // symGraph pointer.
  SymGraph *graph() const { return m_symGraph; }

private:
  static Symbolic constBinaryOp(const Symbolic &lhs, const Symbolic &rhs,
                                Sym::value_type v) {
    return Symbolic{selectSymGraph(lhs, rhs), Sym::Const(v)};
  }

  static Symbolic constBinaryOp(const Symbolic &lhs, Sym::value_type v) {
    return Symbolic{lhs.m_symGraph, Sym::Const(v)};
  }

  static SymGraph *selectSymGraph(const Symbolic &lhs, const Symbolic &rhs) {
    SymGraph *symGraph = lhs.m_symGraph;
    if (symGraph == nullptr) {
      symGraph = rhs.m_symGraph;
    }
    return symGraph;
  }

  SymGraph *m_symGraph;
  Sym m_self;
};

} // namespace tessera

template <> struct fmt::formatter<tessera::Symbolic> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::Symbolic &sym, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", sym.to_string());
  }
};
