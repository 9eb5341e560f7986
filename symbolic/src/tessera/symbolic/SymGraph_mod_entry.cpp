#include "tessera/diag/invalid_argument.hpp"
#include "tessera/symbolic/SymGraph.hpp"
#include <fmt/format.h>

namespace tessera {

Sym SymGraph::mod_xx(Sym lhs, Sym rhs) {
  if (rhs.isConstant() && rhs.constant() == 0) {
    diag::invalid_argument(
        fmt::format("SymGraph: modulo of {} by zero", to_string(lhs)));
  }
  if (lhs.isConstant() && rhs.isConstant()) {
    return Sym::Const(emod(lhs.constant(), rhs.constant()));
  }
  if (lhs.isConstant() && lhs.constant() == 0) {
    return Sym::Const(0);
  }
  if (rhs.isConstant()) {
    return mod_sc(lhs.sym(), rhs.constant());
  }
  if (lhs == rhs) {
    return Sym::Const(0);
  }
  if (lhs.isSymbolic() && affine_ratio(m_expressions[lhs.sym()].affine,
                                       m_expressions[rhs.sym()].affine)) {
    return Sym::Const(0);
  }
  NonAffineExpr nonaffine;
  nonaffine.op = NonAffineOp::Mod;
  nonaffine.symbols = {lhs, rhs};
  return require_nonaffine_sym(std::move(nonaffine));
}

Sym SymGraph::mod_sc(symbol lhs, value_type rhs) {
  if (rhs == 1 || rhs == -1) {
    return Sym::Const(0);
  }
  const AffineExpr &affine = m_expressions[lhs].affine;
  bool multiple = true;
  for (const auto &c : affine.coef) {
    if (c.factor % rhs != 0) {
      multiple = false;
      break;
    }
  }
  if (multiple) {
    // k * rhs * X + c  (mod rhs) == c (mod rhs)
    return Sym::Const(emod(affine.constant, rhs));
  }
  NonAffineExpr nonaffine;
  nonaffine.op = NonAffineOp::Mod;
  nonaffine.symbols = {Sym::Symbol(lhs), Sym::Const(rhs)};
  return require_nonaffine_sym(std::move(nonaffine));
}

} // namespace tessera
