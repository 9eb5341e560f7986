#include "tessera/symbolic/SymGraph.hpp"

namespace tessera {

Sym SymGraph::add_xx(Sym lhs, Sym rhs) {
  if (lhs.isConstant() && rhs.isConstant()) {
    return Sym::Const(lhs.constant() + rhs.constant());
  } else if (lhs.isConstant()) {
    return add_sc(rhs.sym(), lhs.constant());
  } else if (rhs.isConstant()) {
    return add_sc(lhs.sym(), rhs.constant());
  } else {
    return add_ss(lhs.sym(), rhs.sym());
  }
}

Sym SymGraph::add_ss(symbol lhs, symbol rhs) {
  AffineExpr affine =
      affine_add(m_expressions[lhs].affine, m_expressions[rhs].affine);
  return require_affine_sym(ExprType::Add, Sym::Symbol(lhs), Sym::Symbol(rhs),
                            affine);
}

Sym SymGraph::add_sc(symbol lhs, value_type rhs) {
  if (rhs == 0) {
    return Sym::Symbol(lhs);
  }
  AffineExpr affine = m_expressions[lhs].affine;
  affine.constant += rhs;
  return require_affine_sym(ExprType::Add, Sym::Symbol(lhs), Sym::Const(rhs),
                            affine);
}

} // namespace tessera
