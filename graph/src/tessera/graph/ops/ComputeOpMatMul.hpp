#pragma once

#include <fmt/core.h>

namespace tessera::graph {

// (..., M, K) x (K, N) or batched (..., M, K) x (..., K, N).
struct ComputeOpMatMul {
  bool batched;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOpMatMul> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpMatMul &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{batched={}}}", op.batched);
  }
};
