#include "tessera/symbolic/SymGraph.hpp"

namespace tessera {

std::pair<SymGraph::value_type, SymGraph::value_type>
SymGraph::floordivmod(value_type a, value_type b) {
  assert(b != 0);
  value_type q = a / b;
  value_type r = a % b;
  if (r != 0 && ((r < 0) != (b < 0))) {
    --q;
    r += b;
  }
  return {q, r};
}

SymGraph::value_type SymGraph::emod(value_type lhs, value_type rhs) {
  return floordivmod(lhs, rhs).second;
}

bool SymGraph::sym_less(const Sym &lhs, const Sym &rhs) {
  if (lhs.isConstant() != rhs.isConstant()) {
    return lhs.isConstant();
  }
  if (lhs.isConstant()) {
    return lhs.constant() < rhs.constant();
  }
  return lhs.sym() < rhs.sym();
}

} // namespace tessera
