#include "tessera/symbolic/SymGraph.hpp"
#include <algorithm>

namespace tessera {

Sym SymGraph::minmax_xx(NonAffineOp op, Sym lhs, Sym rhs) {
  assert(op == NonAffineOp::Min || op == NonAffineOp::Max);
  const auto pick = [op](value_type a, value_type b) {
    return op == NonAffineOp::Min ? std::min(a, b) : std::max(a, b);
  };
  if (lhs.isConstant() && rhs.isConstant()) {
    return Sym::Const(pick(lhs.constant(), rhs.constant()));
  }
  if (lhs == rhs) {
    return lhs;
  }

  // Flatten nested applications of the same operator.
  memory::vector<Sym> operands;
  for (Sym s : {lhs, rhs}) {
    const NonAffineExpr *inner = nonaffine_of(s);
    if (inner != nullptr && inner->op == op) {
      operands.insert(operands.end(), inner->symbols.begin(),
                      inner->symbols.end());
    } else {
      operands.push_back(s);
    }
  }

  memory::optional<value_type> literal;
  memory::vector<Sym> kept;
  for (const Sym &s : operands) {
    if (s.isConstant()) {
      literal = literal.has_value() ? pick(*literal, s.constant())
                                    : s.constant();
      continue;
    }
    // Operands that differ by a literal are ordered, only the dominating one
    // survives.
    bool dominated = false;
    for (auto it = kept.begin(); it != kept.end();) {
      auto delta = constantDifference(s, *it);
      if (!delta.has_value()) {
        ++it;
        continue;
      }
      const bool wins = op == NonAffineOp::Min ? *delta < 0 : *delta > 0;
      if (wins) {
        it = kept.erase(it);
      } else {
        dominated = true;
        break;
      }
    }
    if (!dominated) {
      kept.push_back(s);
    }
  }

  NonAffineExpr nonaffine;
  nonaffine.op = op;
  if (literal.has_value()) {
    nonaffine.symbols.push_back(Sym::Const(*literal));
  }
  nonaffine.symbols.insert(nonaffine.symbols.end(), kept.begin(), kept.end());
  assert(!nonaffine.symbols.empty());
  if (nonaffine.symbols.size() == 1) {
    return nonaffine.symbols.front();
  }
  std::sort(nonaffine.symbols.begin(), nonaffine.symbols.end(), sym_less);
  return require_nonaffine_sym(std::move(nonaffine));
}

Sym SymGraph::minmax_offset(NonAffineOp op, memory::vector<Sym> operands,
                            value_type offset) {
  assert(!operands.empty());
  Sym result = add_xx(operands.front(), Sym::Const(offset));
  for (std::size_t i = 1; i < operands.size(); ++i) {
    result = minmax_xx(op, result, add_xx(operands[i], Sym::Const(offset)));
  }
  return result;
}

} // namespace tessera
