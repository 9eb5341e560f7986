#include "tessera/diag/invalid_argument.hpp"
#include "tessera/symbolic/SymGraph.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace tessera {

SymGraphEval SymGraph::eval(memory::span<const SymSpec> symSpecs) const {
  memory::vector<memory::optional<value_type>> dp(m_expressions.size());

  for (const auto &spec : symSpecs) {
    if (spec.symbol >= m_expressions.size() ||
        m_expressions[spec.symbol].expr != ExprType::Identity) {
      diag::invalid_argument(
          fmt::format("SymGraph: [{}] is not a run-time symbol", spec.symbol));
    }
    dp[spec.symbol] = spec.value;
  }

  const auto resolve = [&](Sym sym) -> memory::optional<value_type> {
    if (sym.isConstant()) {
      return sym.constant();
    } else {
      return dp[sym.sym()];
    }
  };

  for (std::size_t e = 0; e < m_expressions.size(); ++e) {
    if (dp[e].has_value()) {
      continue;
    }
    const auto &expr = m_expressions[e];
    switch (expr.expr) {
    case ExprType::Identity:
      break;
    case ExprType::NonAffine: {
      const auto &nonaffine = m_nonAffineCache.expressions[expr.lhs.sym()];
      memory::vector<value_type> values;
      values.reserve(nonaffine.symbols.size());
      for (const auto &s : nonaffine.symbols) {
        auto v = resolve(s);
        if (!v.has_value()) {
          break;
        }
        values.push_back(*v);
      }
      if (values.size() != nonaffine.symbols.size()) {
        break;
      }
      switch (nonaffine.op) {
      case NonAffineOp::Mul: {
        value_type prod = 1;
        for (value_type v : values) {
          prod *= v;
        }
        dp[e] = prod;
        break;
      }
      case NonAffineOp::Div:
        assert(values.size() == 2);
        if (values[1] != 0) {
          dp[e] = floordivmod(values[0], values[1]).first;
        }
        break;
      case NonAffineOp::Mod:
        assert(values.size() == 2);
        if (values[1] != 0) {
          dp[e] = emod(values[0], values[1]);
        }
        break;
      case NonAffineOp::Min:
        dp[e] = *std::min_element(values.begin(), values.end());
        break;
      case NonAffineOp::Max:
        dp[e] = *std::max_element(values.begin(), values.end());
        break;
      }
      break;
    }
    case ExprType::Div:
    case ExprType::Mod:
    case ExprType::Sub:
    case ExprType::Mul:
    case ExprType::Add: {
      // The canonical affine form only references symbols that were created
      // before this expression.
      value_type acc = expr.affine.constant;
      bool succ = true;
      for (const auto &coef : expr.affine.coef) {
        assert(coef.sym < e);
        if (!dp[coef.sym].has_value()) {
          succ = false;
          break;
        }
        acc += coef.factor * *dp[coef.sym];
      }
      if (succ) {
        dp[e] = acc;
      }
      break;
    }
    }
  }
  return SymGraphEval(std::move(dp));
}

SymGraphEval SymGraph::eval(memory::span<const NamedSymSpec> symSpecs) const {
  memory::vector<SymSpec> specs;
  specs.reserve(symSpecs.size());
  for (const auto &named : symSpecs) {
    auto sym = symbolOf(named.name);
    if (!sym.has_value()) {
      diag::invalid_argument(
          fmt::format("SymGraph: unknown symbol \"{}\"", named.name));
    }
    specs.push_back(SymSpec{sym->sym(), named.value});
  }
  return eval(memory::span<const SymSpec>(specs));
}

} // namespace tessera
