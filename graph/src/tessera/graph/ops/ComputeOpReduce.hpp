#pragma once

#include <cstddef>
#include <fmt/core.h>

namespace tessera::graph {

enum class ReduceOp {
  Sum,
  Max,
};

struct ComputeOpReduce {
  ReduceOp op;
  std::size_t axis;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOpReduce> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpReduce &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{op={}, axis={}}}",
                          op.op == tessera::graph::ReduceOp::Sum ? "sum"
                                                                 : "max",
                          op.axis);
  }
};
