#pragma once

#include <cstddef>
#include <fmt/core.h>

namespace tessera::graph {

struct ComputeOpConcat {
  std::size_t axis;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOpConcat> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpConcat &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{axis={}}}", op.axis);
  }
};
