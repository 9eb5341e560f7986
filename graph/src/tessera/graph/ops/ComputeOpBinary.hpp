#pragma once

#include "tessera/diag/unreachable.hpp"
#include <fmt/core.h>

namespace tessera::graph {

enum class BinaryOp {
  Add,
  Sub,
  Mul,
  Div,
  Max,
};

struct ComputeOpBinary {
  BinaryOp op;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::BinaryOp> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::BinaryOp &op, FormatContext &ctx) const {
    using tessera::graph::BinaryOp;
    switch (op) {
    case BinaryOp::Add:
      return fmt::format_to(ctx.out(), "add");
    case BinaryOp::Sub:
      return fmt::format_to(ctx.out(), "sub");
    case BinaryOp::Mul:
      return fmt::format_to(ctx.out(), "mul");
    case BinaryOp::Div:
      return fmt::format_to(ctx.out(), "div");
    case BinaryOp::Max:
      return fmt::format_to(ctx.out(), "max");
    }
    tessera::diag::unreachable();
  }
};

template <> struct fmt::formatter<tessera::graph::ComputeOpBinary> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpBinary &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{op={}}}", op.op);
  }
};
