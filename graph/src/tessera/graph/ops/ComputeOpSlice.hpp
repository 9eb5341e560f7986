#pragma once

#include "tessera/graph/RangeSpec.hpp"
#include "tessera/memory/container/vector.hpp"
#include <fmt/format.h>

namespace tessera::graph {

struct ComputeOpSlice {
  memory::vector<RangeSpec> ranges;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOpSlice> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpSlice &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{ranges=[{}]}}",
                          fmt::join(op.ranges, ", "));
  }
};
