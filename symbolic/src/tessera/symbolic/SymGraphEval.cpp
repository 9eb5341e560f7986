#include "tessera/symbolic/SymGraphEval.hpp"
#include "tessera/symbolic/Symbolic.hpp"

namespace tessera {

memory::optional<Sym::value_type>
SymGraphEval::operator[](const Sym &sym) const {
  if (sym.isConstant()) {
    return sym.constant();
  }
  if (sym.sym() >= m_dp.size()) {
    return memory::nullopt;
  }
  return m_dp[sym.sym()];
}

memory::optional<Sym::value_type>
SymGraphEval::operator[](const Symbolic &s) const {
  return (*this)[*s];
}

} // namespace tessera
