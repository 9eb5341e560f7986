#pragma once

#include <fmt/core.h>

namespace tessera::graph {

struct ComputeOpConstant {
  float value;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOpConstant> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpConstant &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{value={}}}", op.value);
  }
};
