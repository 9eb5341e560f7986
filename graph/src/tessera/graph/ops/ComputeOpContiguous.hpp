#pragma once

#include <fmt/core.h>

namespace tessera::graph {

// Materializes a view into a fresh row-major buffer.
struct ComputeOpContiguous {};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOpContiguous> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpContiguous &,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{}}");
  }
};
