#include "tessera/symbolic/SymGraph.hpp"

namespace tessera {

Sym SymGraph::sub_xx(Sym lhs, Sym rhs) {
  if (lhs.isConstant() && rhs.isConstant()) {
    return Sym::Const(lhs.constant() - rhs.constant());
  } else if (lhs.isConstant()) {
    return sub_cs(lhs.constant(), rhs.sym());
  } else if (rhs.isConstant()) {
    return sub_sc(lhs.sym(), rhs.constant());
  } else {
    return sub_ss(lhs.sym(), rhs.sym());
  }
}

Sym SymGraph::sub_ss(symbol lhs, symbol rhs) {
  if (lhs == rhs) {
    return Sym::Const(0);
  }
  AffineExpr affine =
      affine_sub(m_expressions[lhs].affine, m_expressions[rhs].affine);
  return require_affine_sym(ExprType::Sub, Sym::Symbol(lhs), Sym::Symbol(rhs),
                            affine);
}

Sym SymGraph::sub_sc(symbol lhs, value_type rhs) {
  if (rhs == 0) {
    return Sym::Symbol(lhs);
  }
  AffineExpr affine = m_expressions[lhs].affine;
  affine.constant -= rhs;
  return require_affine_sym(ExprType::Sub, Sym::Symbol(lhs), Sym::Const(rhs),
                            affine);
}

Sym SymGraph::sub_cs(value_type lhs, symbol rhs) {
  AffineExpr affine = affine_mul(m_expressions[rhs].affine, -1);
  affine.constant += lhs;
  return require_affine_sym(ExprType::Sub, Sym::Const(lhs), Sym::Symbol(rhs),
                            affine);
}

} // namespace tessera
