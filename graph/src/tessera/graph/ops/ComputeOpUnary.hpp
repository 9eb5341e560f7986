#pragma once

#include "tessera/diag/unreachable.hpp"
#include <fmt/core.h>

namespace tessera::graph {

enum class UnaryOp {
  Neg,
  Exp,
  Log,
  Sin,
  Cos,
  Sqrt,
  Recip,
};

struct ComputeOpUnary {
  UnaryOp op;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::UnaryOp> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::UnaryOp &op, FormatContext &ctx) const {
    using tessera::graph::UnaryOp;
    switch (op) {
    case UnaryOp::Neg:
      return fmt::format_to(ctx.out(), "neg");
    case UnaryOp::Exp:
      return fmt::format_to(ctx.out(), "exp");
    case UnaryOp::Log:
      return fmt::format_to(ctx.out(), "log");
    case UnaryOp::Sin:
      return fmt::format_to(ctx.out(), "sin");
    case UnaryOp::Cos:
      return fmt::format_to(ctx.out(), "cos");
    case UnaryOp::Sqrt:
      return fmt::format_to(ctx.out(), "sqrt");
    case UnaryOp::Recip:
      return fmt::format_to(ctx.out(), "recip");
    }
    tessera::diag::unreachable();
  }
};

template <> struct fmt::formatter<tessera::graph::ComputeOpUnary> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpUnary &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{op={}}}", op.op);
  }
};
