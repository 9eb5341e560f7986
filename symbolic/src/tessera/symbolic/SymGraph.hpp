#pragma once

#include "tessera/memory/container/optional.hpp"
#include "tessera/memory/container/span.hpp"
#include "tessera/memory/container/string.hpp"
#include "tessera/memory/container/string_view.hpp"
#include "tessera/symbolic/Sym.hpp"
#include "tessera/symbolic/SymGraphEval.hpp"
#include <cassert>
#include <concepts>
#include <type_traits>
#include <utility>

#include "tessera/symbolic/SymGraph_types.inl"

namespace tessera {

template <typename T>
concept SymOperand = std::same_as<T, Sym> || std::is_integral_v<T>;

// Append-only, hash-consed store of integer expressions over run-time
// symbols. Affine expressions are kept in a canonical form, therefore two
// structurally equal expressions always map to the same Sym.
class SymGraph {
private:
  using AffineCoef = symbolic::details::AffineCoef;
  using AffineExpr = symbolic::details::AffineExpr;
  using Expr = symbolic::details::Expr;
  using ExprType = symbolic::details::ExprType;
  using NonAffineExpr = symbolic::details::NonAffineExpr;
  using NonAffineOp = symbolic::details::NonAffineOp;

public:
  using symbol = symbolic::details::symbol;
  using value_type = symbolic::details::value_type;

  SymGraph() = default;

  // Anonymous run-time symbol.
  Sym var();
  // Named run-time symbol, returns the existing symbol if the name is taken.
  Sym var(memory::string_view name);

  memory::optional<Sym> symbolOf(memory::string_view name) const;
  memory::optional<memory::string_view> nameOf(Sym sym) const;

  template <SymOperand L, SymOperand R> Sym add(L lhs, R rhs);
  template <SymOperand L, SymOperand R> Sym sub(L lhs, R rhs);
  template <SymOperand L, SymOperand R> Sym mul(L lhs, R rhs);
  // Floor division.
  template <SymOperand L, SymOperand R> Sym div(L lhs, R rhs);
  // Floor modulo, a non-zero result takes the sign of the divisor.
  template <SymOperand L, SymOperand R> Sym mod(L lhs, R rhs);
  template <SymOperand L, SymOperand R> Sym min(L lhs, R rhs);
  template <SymOperand L, SymOperand R> Sym max(L lhs, R rhs);

  Sym resolve(value_type v) const;
  Sym resolve(Sym sym) const;

  // Difference lhs - rhs if it does not depend on any symbol.
  memory::optional<value_type> constantDifference(Sym lhs, Sym rhs) const;

  // Literal bounds that hold for every binding of the symbols. Only literal
  // operands of min and max contribute, plain symbols are unbounded.
  memory::optional<value_type> lowerBound(Sym sym) const;
  memory::optional<value_type> upperBound(Sym sym) const;

  SymGraphEval eval(memory::span<const SymSpec> symSpecs) const;
  SymGraphEval eval(memory::span<const NamedSymSpec> symSpecs) const;

  memory::string to_string(Sym sym) const;

  std::size_t size() const { return m_expressions.size(); }

  static auto floordivmod(value_type a, value_type b)
      -> std::pair<value_type, value_type>;
  static value_type emod(value_type lhs, value_type rhs);

private:
  // Symbol caches.
  auto next_sym() -> symbol;
  auto create_variable(ExprType type) -> symbol;
  auto require_affine_sym(ExprType type, Sym lhs, Sym rhs,
                          const AffineExpr &affine) -> Sym;
  auto require_nonaffine_sym(NonAffineExpr nonaffine) -> Sym;
  auto affine_of(Sym sym) const -> AffineExpr;
  auto nonaffine_of(Sym sym) const -> const NonAffineExpr *;

  // Expression handlers.
  Sym add_xx(Sym lhs, Sym rhs);
  Sym add_ss(symbol lhs, symbol rhs);
  Sym add_sc(symbol lhs, value_type rhs);

  Sym sub_xx(Sym lhs, Sym rhs);
  Sym sub_ss(symbol lhs, symbol rhs);
  Sym sub_sc(symbol lhs, value_type rhs);
  Sym sub_cs(value_type lhs, symbol rhs);

  Sym mul_xx(Sym lhs, Sym rhs);
  Sym mul_ss(symbol lhs, symbol rhs);
  Sym mul_sc(symbol lhs, value_type rhs);

  Sym div_xx(Sym lhs, Sym rhs);
  Sym div_sc(symbol lhs, value_type rhs);

  Sym mod_xx(Sym lhs, Sym rhs);
  Sym mod_sc(symbol lhs, value_type rhs);

  Sym minmax_xx(NonAffineOp op, Sym lhs, Sym rhs);
  Sym minmax_offset(NonAffineOp op, memory::vector<Sym> operands,
                    value_type offset);

  // Affine solvers.
  static void affine_add_sym(AffineExpr &lhs, symbol s, value_type factor);
  static auto affine_add(const AffineExpr &lhs, const AffineExpr &rhs)
      -> AffineExpr;
  static auto affine_sub(const AffineExpr &lhs, const AffineExpr &rhs)
      -> AffineExpr;
  static auto affine_mul(const AffineExpr &lhs, value_type rhs) -> AffineExpr;
  static auto affine_div(const AffineExpr &lhs, value_type rhs)
      -> memory::optional<AffineExpr>;
  static auto affine_ratio(const AffineExpr &lhs, const AffineExpr &rhs)
      -> memory::optional<value_type>;

  // Helpers.
  static bool sym_less(const Sym &lhs, const Sym &rhs);
  auto bound_of(Sym sym, bool upper) const -> memory::optional<value_type>;
  auto atom_bound(symbol atom, bool upper) const
      -> memory::optional<value_type>;
  memory::string to_string_impl(Sym sym, bool nested) const;

  memory::vector<Expr> m_expressions;
  symbolic::details::AffineExprCache m_affineCache;
  symbolic::details::NonAffineExprCache m_nonAffineCache;
  memory::hash_map<memory::string, symbol> m_symbolsByName;
  memory::hash_map<symbol, memory::string> m_namesBySymbol;
};

} // namespace tessera

// Templated functions definitions.
#include "tessera/symbolic/SymGraph_api_templates.inl"
