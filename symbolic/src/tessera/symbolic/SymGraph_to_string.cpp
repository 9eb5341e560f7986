#include "tessera/diag/unreachable.hpp"
#include "tessera/symbolic/SymGraph.hpp"
#include <fmt/format.h>

namespace tessera {

memory::string SymGraph::to_string(Sym sym) const {
  return to_string_impl(resolve(sym), false);
}

memory::string SymGraph::to_string_impl(Sym sym, bool nested) const {
  if (sym.isConstant()) {
    return fmt::format("{}", sym.constant());
  }
  const auto &expr = m_expressions[sym.sym()];
  if (expr.affine.isPureConstant()) {
    return fmt::format("{}", expr.affine.constant);
  }
  switch (expr.expr) {
  case ExprType::Identity:
    if (auto name = nameOf(sym)) {
      return memory::string(*name);
    }
    return fmt::format("[{}]", sym.sym());
  case ExprType::NonAffine: {
    const auto &nonaffine = m_nonAffineCache.expressions[expr.lhs.sym()];
    const auto join = [&](memory::string_view sep) {
      memory::string str;
      for (std::size_t i = 0; i < nonaffine.symbols.size(); ++i) {
        if (i != 0) {
          str.append(sep);
        }
        str.append(to_string_impl(nonaffine.symbols[i], true));
      }
      return str;
    };
    switch (nonaffine.op) {
    case NonAffineOp::Mul:
      return nested ? fmt::format("({})", join(" * ")) : join(" * ");
    case NonAffineOp::Div:
      return nested ? fmt::format("({})", join(" / ")) : join(" / ");
    case NonAffineOp::Mod:
      return nested ? fmt::format("({})", join(" % ")) : join(" % ");
    case NonAffineOp::Min:
      return fmt::format("min({})", join(", "));
    case NonAffineOp::Max:
      return fmt::format("max({})", join(", "));
    }
    diag::unreachable();
  }
  case ExprType::Div:
  case ExprType::Mod:
  case ExprType::Sub:
  case ExprType::Mul:
  case ExprType::Add:
    break;
  }

  // Affine expressions are printed from their canonical form.
  memory::string str;
  std::size_t terms = 0;
  for (const auto &coef : expr.affine.coef) {
    memory::string atom = to_string_impl(Sym::Symbol(coef.sym), true);
    const bool negative = coef.factor < 0;
    const value_type magnitude = negative ? -coef.factor : coef.factor;
    if (terms == 0) {
      str.append(negative ? "-" : "");
    } else {
      str.append(negative ? " - " : " + ");
    }
    if (magnitude == 1) {
      str.append(atom);
    } else {
      str.append(fmt::format("{}*{}", magnitude, atom));
    }
    ++terms;
  }
  if (expr.affine.constant > 0) {
    str.append(fmt::format(" + {}", expr.affine.constant));
    ++terms;
  } else if (expr.affine.constant < 0) {
    str.append(fmt::format(" - {}", -expr.affine.constant));
    ++terms;
  }
  if (nested && terms > 1) {
    return fmt::format("({})", str);
  }
  return str;
}

} // namespace tessera
