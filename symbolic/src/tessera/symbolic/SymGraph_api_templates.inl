#pragma once
#include "tessera/symbolic/SymGraph.hpp"

namespace tessera {

namespace symbolic::details {

template <SymOperand T> Sym to_sym(const SymGraph &graph, T v) {
  if constexpr (std::same_as<T, Sym>) {
    return graph.resolve(v);
  } else {
    return Sym::Const(v);
  }
}

} // namespace symbolic::details

template <SymOperand L, SymOperand R> Sym SymGraph::add(L lhs, R rhs) {
  return add_xx(symbolic::details::to_sym(*this, lhs),
                symbolic::details::to_sym(*this, rhs));
}

template <SymOperand L, SymOperand R> Sym SymGraph::sub(L lhs, R rhs) {
  return sub_xx(symbolic::details::to_sym(*this, lhs),
                symbolic::details::to_sym(*this, rhs));
}

template <SymOperand L, SymOperand R> Sym SymGraph::mul(L lhs, R rhs) {
  return mul_xx(symbolic::details::to_sym(*this, lhs),
                symbolic::details::to_sym(*this, rhs));
}

template <SymOperand L, SymOperand R> Sym SymGraph::div(L lhs, R rhs) {
  return div_xx(symbolic::details::to_sym(*this, lhs),
                symbolic::details::to_sym(*this, rhs));
}

template <SymOperand L, SymOperand R> Sym SymGraph::mod(L lhs, R rhs) {
  return mod_xx(symbolic::details::to_sym(*this, lhs),
                symbolic::details::to_sym(*this, rhs));
}

template <SymOperand L, SymOperand R> Sym SymGraph::min(L lhs, R rhs) {
  return minmax_xx(NonAffineOp::Min, symbolic::details::to_sym(*this, lhs),
                   symbolic::details::to_sym(*this, rhs));
}

template <SymOperand L, SymOperand R> Sym SymGraph::max(L lhs, R rhs) {
  return minmax_xx(NonAffineOp::Max, symbolic::details::to_sym(*this, lhs),
                   symbolic::details::to_sym(*this, rhs));
}

} // namespace tessera
