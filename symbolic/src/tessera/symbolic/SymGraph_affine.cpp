#include "tessera/symbolic/SymGraph.hpp"
#include <algorithm>

namespace tessera {

SymGraph::symbol SymGraph::next_sym() {
  symbol s = m_expressions.size();
  m_expressions.emplace_back();
  return s;
}

SymGraph::symbol SymGraph::create_variable(ExprType type) {
  assert(type == ExprType::Identity || type == ExprType::NonAffine);
  symbol s = next_sym();
  m_expressions[s].expr = type;
  m_expressions[s].affine.constant = 0;
  m_expressions[s].affine.coef.push_back(AffineCoef{s, 1});
  m_affineCache.insert(std::make_pair(m_expressions[s].affine, s));
  return s;
}

Sym SymGraph::require_affine_sym(ExprType type, Sym lhs, Sym rhs,
                                 const AffineExpr &affine) {
  assert(type != ExprType::NonAffine && type != ExprType::Identity);
  if (affine.isPureConstant()) {
    return Sym::Const(affine.constant);
  }
  // min(a, b) + c is stored as min(a + c, b + c).
  if (affine.constant != 0 && affine.coef.size() == 1 &&
      affine.coef[0].factor == 1) {
    const NonAffineExpr *inner =
        nonaffine_of(Sym::Symbol(affine.coef[0].sym));
    if (inner != nullptr &&
        (inner->op == NonAffineOp::Min || inner->op == NonAffineOp::Max)) {
      return minmax_offset(inner->op, inner->symbols, affine.constant);
    }
  }

  auto it = m_affineCache.find(affine);
  if (it != m_affineCache.end()) {
    return Sym::Symbol(it->second);
  }
  symbol s = next_sym();
  m_expressions[s].expr = type;
  m_expressions[s].affine = affine;
  m_expressions[s].lhs = lhs;
  m_expressions[s].rhs = rhs;
  m_affineCache.insert(std::make_pair(affine, s));
  return Sym::Symbol(s);
}

Sym SymGraph::require_nonaffine_sym(NonAffineExpr nonaffine) {
  auto it = m_nonAffineCache.cache.find(nonaffine);
  if (it != m_nonAffineCache.cache.end()) {
    return Sym::Symbol(it->second);
  }
  const std::size_t index = m_nonAffineCache.expressions.size();
  symbol s = create_variable(ExprType::NonAffine);
  m_expressions[s].lhs = Sym::Symbol(index);
  nonaffine.sym = s;
  m_nonAffineCache.cache.emplace(nonaffine, s);
  m_nonAffineCache.expressions.push_back(std::move(nonaffine));
  return Sym::Symbol(s);
}

SymGraph::AffineExpr SymGraph::affine_of(Sym sym) const {
  if (sym.isConstant()) {
    AffineExpr affine;
    affine.constant = sym.constant();
    return affine;
  }
  return m_expressions[sym.sym()].affine;
}

const SymGraph::NonAffineExpr *SymGraph::nonaffine_of(Sym sym) const {
  if (sym.isConstant()) {
    return nullptr;
  }
  const auto &expr = m_expressions[sym.sym()];
  if (expr.expr != ExprType::NonAffine) {
    return nullptr;
  }
  return &m_nonAffineCache.expressions[expr.lhs.sym()];
}

void SymGraph::affine_add_sym(AffineExpr &lhs, symbol s, value_type factor) {
  if (factor == 0) {
    return;
  }
  auto it = std::lower_bound(
      lhs.coef.begin(), lhs.coef.end(), s,
      [](const AffineCoef &coef, symbol sym) { return coef.sym < sym; });
  if (it != lhs.coef.end() && it->sym == s) {
    it->factor += factor;
    if (it->factor == 0) {
      lhs.coef.erase(it);
    }
  } else {
    lhs.coef.insert(it, AffineCoef{s, factor});
  }
}

SymGraph::AffineExpr SymGraph::affine_add(const AffineExpr &lhs,
                                          const AffineExpr &rhs) {
  AffineExpr out = lhs;
  for (const auto &c : rhs.coef) {
    affine_add_sym(out, c.sym, c.factor);
  }
  out.constant += rhs.constant;
  return out;
}

SymGraph::AffineExpr SymGraph::affine_sub(const AffineExpr &lhs,
                                          const AffineExpr &rhs) {
  AffineExpr out = lhs;
  for (const auto &c : rhs.coef) {
    affine_add_sym(out, c.sym, -c.factor);
  }
  out.constant -= rhs.constant;
  return out;
}

SymGraph::AffineExpr SymGraph::affine_mul(const AffineExpr &lhs,
                                          value_type rhs) {
  AffineExpr out;
  if (rhs == 0) {
    return out;
  }
  out.coef.reserve(lhs.coef.size());
  for (const auto &c : lhs.coef) {
    out.coef.push_back(AffineCoef{c.sym, c.factor * rhs});
  }
  out.constant = lhs.constant * rhs;
  return out;
}

memory::optional<SymGraph::AffineExpr>
SymGraph::affine_div(const AffineExpr &lhs, value_type rhs) {
  assert(rhs != 0);
  AffineExpr out;
  out.coef.reserve(lhs.coef.size());
  for (const auto &c : lhs.coef) {
    if (c.factor % rhs != 0) {
      return memory::nullopt;
    }
    out.coef.push_back(AffineCoef{c.sym, c.factor / rhs});
  }
  if (lhs.constant % rhs != 0) {
    return memory::nullopt;
  }
  out.constant = lhs.constant / rhs;
  return out;
}

memory::optional<SymGraph::value_type>
SymGraph::affine_ratio(const AffineExpr &lhs, const AffineExpr &rhs) {
  if (rhs.isPureConstant() || lhs.coef.size() != rhs.coef.size()) {
    return memory::nullopt;
  }
  if (lhs.coef[0].sym != rhs.coef[0].sym ||
      lhs.coef[0].factor % rhs.coef[0].factor != 0) {
    return memory::nullopt;
  }
  const value_type k = lhs.coef[0].factor / rhs.coef[0].factor;
  for (std::size_t c = 0; c < lhs.coef.size(); ++c) {
    if (lhs.coef[c].sym != rhs.coef[c].sym ||
        lhs.coef[c].factor != k * rhs.coef[c].factor) {
      return memory::nullopt;
    }
  }
  if (lhs.constant != k * rhs.constant) {
    return memory::nullopt;
  }
  return k;
}

} // namespace tessera
