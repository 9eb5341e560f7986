#include "tessera/diag/invalid_argument.hpp"
#include "tessera/symbolic/SymGraph.hpp"
#include <fmt/format.h>

namespace tessera {

Sym SymGraph::div_xx(Sym lhs, Sym rhs) {
  if (rhs.isConstant() && rhs.constant() == 0) {
    diag::invalid_argument(
        fmt::format("SymGraph: division of {} by zero", to_string(lhs)));
  }
  if (lhs.isConstant() && rhs.isConstant()) {
    return Sym::Const(floordivmod(lhs.constant(), rhs.constant()).first);
  }
  if (lhs.isConstant() && lhs.constant() == 0) {
    return Sym::Const(0);
  }
  if (rhs.isConstant()) {
    return div_sc(lhs.sym(), rhs.constant());
  }
  if (lhs == rhs) {
    return Sym::Const(1);
  }
  if (lhs.isSymbolic()) {
    if (auto k = affine_ratio(m_expressions[lhs.sym()].affine,
                              m_expressions[rhs.sym()].affine)) {
      return Sym::Const(*k);
    }
  }
  NonAffineExpr nonaffine;
  nonaffine.op = NonAffineOp::Div;
  nonaffine.symbols = {lhs, rhs};
  return require_nonaffine_sym(std::move(nonaffine));
}

Sym SymGraph::div_sc(symbol lhs, value_type rhs) {
  if (rhs == 1) {
    return Sym::Symbol(lhs);
  }
  if (auto quotient = affine_div(m_expressions[lhs].affine, rhs)) {
    return require_affine_sym(ExprType::Div, Sym::Symbol(lhs), Sym::Const(rhs),
                              *quotient);
  }
  NonAffineExpr nonaffine;
  nonaffine.op = NonAffineOp::Div;
  nonaffine.symbols = {Sym::Symbol(lhs), Sym::Const(rhs)};
  return require_nonaffine_sym(std::move(nonaffine));
}

} // namespace tessera
