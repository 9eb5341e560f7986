#pragma once

#include "tessera/graph/ReshapeDim.hpp"
#include "tessera/memory/container/vector.hpp"
#include <fmt/format.h>

namespace tessera::graph {

struct ComputeOpReshape {
  memory::vector<ReshapeDim> dims;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOpReshape> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpReshape &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{dims=[{}]}}", fmt::join(op.dims, ", "));
  }
};
