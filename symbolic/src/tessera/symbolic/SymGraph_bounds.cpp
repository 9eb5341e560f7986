#include "tessera/symbolic/SymGraph.hpp"
#include <algorithm>

namespace tessera {

memory::optional<SymGraph::value_type> SymGraph::lowerBound(Sym sym) const {
  return bound_of(resolve(sym), false);
}

memory::optional<SymGraph::value_type> SymGraph::upperBound(Sym sym) const {
  return bound_of(resolve(sym), true);
}

memory::optional<SymGraph::value_type> SymGraph::bound_of(Sym sym,
                                                          bool upper) const {
  if (sym.isConstant()) {
    return sym.constant();
  }
  const Expr &expr = m_expressions[sym.sym()];
  if (expr.expr == ExprType::Identity || expr.expr == ExprType::NonAffine) {
    return atom_bound(sym.sym(), upper);
  }
  value_type bound = expr.affine.constant;
  for (const auto &c : expr.affine.coef) {
    auto b = atom_bound(c.sym, c.factor > 0 ? upper : !upper);
    if (!b.has_value()) {
      return memory::nullopt;
    }
    bound += c.factor * *b;
  }
  return bound;
}

memory::optional<SymGraph::value_type>
SymGraph::atom_bound(symbol atom, bool upper) const {
  const NonAffineExpr *nonaffine = nonaffine_of(Sym::Symbol(atom));
  if (nonaffine == nullptr || (nonaffine->op != NonAffineOp::Min &&
                               nonaffine->op != NonAffineOp::Max)) {
    return memory::nullopt;
  }
  const bool isMin = nonaffine->op == NonAffineOp::Min;
  memory::optional<value_type> bound;
  if (isMin == upper) {
    // min(a, b) <= bound(a) for any single bounded operand.
    for (const Sym &operand : nonaffine->symbols) {
      auto b = bound_of(operand, upper);
      if (!b.has_value()) {
        continue;
      }
      if (!bound.has_value()) {
        bound = *b;
      } else {
        bound = isMin ? std::min(*bound, *b) : std::max(*bound, *b);
      }
    }
    return bound;
  }
  // min(a, b) >= min(bound(a), bound(b)) needs every operand bounded.
  for (const Sym &operand : nonaffine->symbols) {
    auto b = bound_of(operand, upper);
    if (!b.has_value()) {
      return memory::nullopt;
    }
    if (!bound.has_value()) {
      bound = *b;
    } else {
      bound = isMin ? std::min(*bound, *b) : std::max(*bound, *b);
    }
  }
  return bound;
}

} // namespace tessera
