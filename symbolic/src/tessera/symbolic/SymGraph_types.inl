#include "tessera/memory/container/hashmap.hpp"
#include "tessera/memory/container/vector.hpp"
#include "tessera/symbolic/Sym.hpp"
#include <cstdint>
#include <type_traits>

namespace tessera::symbolic::details {

using symbol = Sym::symbol;
using value_type = Sym::value_type;

struct AffineCoef {
  symbol sym;
  value_type factor;
};

struct AffineExpr {
  // NOTE: coef are always sorted by sym and never hold a zero factor.
  memory::vector<AffineCoef> coef;
  value_type constant = value_type(0);

  bool isPureConstant() const { return coef.empty(); }
};

struct AffineExprHash {
  std::size_t operator()(const AffineExpr &expr) const {
    std::hash<std::uint64_t> hasher;
    std::hash<std::int64_t> ihasher;
    std::size_t hash = 0x1987231298731212;
    for (const auto &coef : expr.coef) {
      hash ^= hasher(coef.sym) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
      hash ^= ihasher(coef.factor) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
    }
    hash ^= ihasher(expr.constant) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
    return hash;
  }
};

struct AffineExprComp {
  bool operator()(const AffineExpr &lhs, const AffineExpr &rhs) const {
    if (lhs.coef.size() != rhs.coef.size()) {
      return false;
    }
    if (lhs.constant != rhs.constant) {
      return false;
    }
    for (std::size_t c = 0; c < lhs.coef.size(); ++c) {
      if ((lhs.coef[c].sym != rhs.coef[c].sym) ||
          (lhs.coef[c].factor != rhs.coef[c].factor)) {
        return false;
      }
    }
    return true;
  }
};

using AffineExprCache =
    memory::hash_map<AffineExpr, symbol, AffineExprHash, AffineExprComp>;

enum class ExprType {
  Identity,  // named or anonymous run-time symbol
  NonAffine, // lhs indexes the non-affine expression table
  Div,       // a / b
  Mod,       // a % b
  Sub,       // a - b
  Mul,       // a * b
  Add,       // a + b
};

struct Expr {
  ExprType expr = ExprType::Identity;
  AffineExpr affine;
  Sym lhs = Sym::Const(0);
  Sym rhs = Sym::Const(0);
};

enum class NonAffineOp {
  Mul,
  Div,
  Mod,
  Min,
  Max,
};

struct NonAffineExpr {
  NonAffineOp op;
  // NOTE: symbols might be a multiset for example 4,X,X,Y is valid!
  // For associative ops symbols are sorted (constants asc, symbols asc)
  memory::vector<Sym> symbols;
  symbol sym = symbol(-1);
};

struct NonAffineExprHash {
  std::size_t operator()(const NonAffineExpr &expr) const {
    std::hash<std::uint64_t> hasher;
    std::hash<bool> bhasher;
    std::size_t hash = 0x1987231298731212;
    for (const auto &sym : expr.symbols) {
      hash ^=
          bhasher(sym.isConstant()) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
      hash ^=
          hasher(sym.isConstant() ? static_cast<std::uint64_t>(sym.constant())
                                  : sym.sym()) +
          0x9e3779b9 + (hash << 6) + (hash >> 2);
    }
    hash ^= hasher(static_cast<std::uint64_t>(
                static_cast<std::underlying_type_t<NonAffineOp>>(expr.op))) +
            0x9e3779b9 + (hash << 6) + (hash >> 2);
    return hash;
  }
};

struct NonAffineExprComp {
  bool operator()(const NonAffineExpr &lhs, const NonAffineExpr &rhs) const {
    if (lhs.op != rhs.op) {
      return false;
    }
    if (lhs.symbols.size() != rhs.symbols.size()) {
      return false;
    }
    for (std::size_t c = 0; c < lhs.symbols.size(); ++c) {
      if (lhs.symbols[c] != rhs.symbols[c]) {
        return false;
      }
    }
    return true;
  }
};

struct NonAffineExprCache {
  memory::vector<NonAffineExpr> expressions;
  memory::hash_map<NonAffineExpr, symbol, NonAffineExprHash, NonAffineExprComp>
      cache;
};

} // namespace tessera::symbolic::details
