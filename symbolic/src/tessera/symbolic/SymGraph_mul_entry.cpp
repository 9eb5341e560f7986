#include "tessera/symbolic/SymGraph.hpp"
#include <algorithm>

namespace tessera {

Sym SymGraph::mul_xx(const Sym lhs, const Sym rhs) {
  if (lhs.isConstant() && rhs.isConstant()) {
    return Sym::Const(lhs.constant() * rhs.constant());
  } else if (lhs.isConstant()) {
    return mul_sc(rhs.sym(), lhs.constant());
  } else if (rhs.isConstant()) {
    return mul_sc(lhs.sym(), rhs.constant());
  } else {
    return mul_ss(lhs.sym(), rhs.sym());
  }
}

Sym SymGraph::mul_sc(symbol lhs, value_type rhs) {
  if (rhs == 0) {
    return Sym::Const(0);
  }
  if (rhs == 1) {
    return Sym::Symbol(lhs);
  }
  AffineExpr affine = affine_mul(m_expressions[lhs].affine, rhs);
  return require_affine_sym(ExprType::Mul, Sym::Symbol(lhs), Sym::Const(rhs),
                            affine);
}

Sym SymGraph::mul_ss(symbol lhs, symbol rhs) {
  // Hoist literal factors out of k * X, such that (2 * X) * Y and X * (2 * Y)
  // share the non-affine product X * Y.
  const auto scaledAtom =
      [&](symbol s) -> memory::optional<std::pair<symbol, value_type>> {
    const AffineExpr &affine = m_expressions[s].affine;
    if (affine.constant == 0 && affine.coef.size() == 1 &&
        affine.coef[0].factor != 1) {
      return std::make_pair(affine.coef[0].sym, affine.coef[0].factor);
    }
    return memory::nullopt;
  };
  if (auto a = scaledAtom(lhs)) {
    return mul_xx(mul_ss(a->first, rhs), Sym::Const(a->second));
  }
  if (auto b = scaledAtom(rhs)) {
    return mul_xx(mul_ss(lhs, b->first), Sym::Const(b->second));
  }

  NonAffineExpr nonaffine;
  nonaffine.op = NonAffineOp::Mul;
  for (symbol s : {lhs, rhs}) {
    const NonAffineExpr *inner = nonaffine_of(Sym::Symbol(s));
    if (inner != nullptr && inner->op == NonAffineOp::Mul) {
      nonaffine.symbols.insert(nonaffine.symbols.end(), inner->symbols.begin(),
                               inner->symbols.end());
    } else {
      nonaffine.symbols.push_back(Sym::Symbol(s));
    }
  }
  std::sort(nonaffine.symbols.begin(), nonaffine.symbols.end(), sym_less);
  return require_nonaffine_sym(std::move(nonaffine));
}

} // namespace tessera
