#include "tessera/symbolic/SymGraph.hpp"

namespace tessera {

Sym SymGraph::resolve(value_type v) const { return Sym::Const(v); }

Sym SymGraph::resolve(Sym sym) const {
  if (sym.isSymbolic()) {
    assert(sym.sym() < m_expressions.size());
    const auto &expr = m_expressions[sym.sym()];
    if (expr.affine.isPureConstant()) {
      return Sym::Const(expr.affine.constant);
    } else {
      return sym;
    }
  } else {
    return Sym::Const(sym.constant());
  }
}

Sym SymGraph::var() { return Sym::Symbol(create_variable(ExprType::Identity)); }

Sym SymGraph::var(memory::string_view name) {
  if (auto existing = symbolOf(name)) {
    return *existing;
  }
  symbol s = create_variable(ExprType::Identity);
  m_symbolsByName.emplace(memory::string(name), s);
  m_namesBySymbol.emplace(s, memory::string(name));
  return Sym::Symbol(s);
}

memory::optional<Sym> SymGraph::symbolOf(memory::string_view name) const {
  auto it = m_symbolsByName.find(memory::string(name));
  if (it == m_symbolsByName.end()) {
    return memory::nullopt;
  }
  return Sym::Symbol(it->second);
}

memory::optional<memory::string_view> SymGraph::nameOf(Sym sym) const {
  if (sym.isConstant()) {
    return memory::nullopt;
  }
  auto it = m_namesBySymbol.find(sym.sym());
  if (it == m_namesBySymbol.end()) {
    return memory::nullopt;
  }
  return memory::string_view(it->second);
}

memory::optional<SymGraph::value_type>
SymGraph::constantDifference(Sym lhs, Sym rhs) const {
  AffineExpr delta = affine_sub(affine_of(resolve(lhs)), affine_of(resolve(rhs)));
  if (!delta.isPureConstant()) {
    return memory::nullopt;
  }
  return delta.constant;
}

} // namespace tessera
