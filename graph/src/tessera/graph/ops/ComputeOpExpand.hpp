#pragma once

#include "tessera/memory/container/vector.hpp"
#include <cstddef>
#include <fmt/format.h>

namespace tessera::graph {

// Broadcast without copying, axes refers to the output axes that have no
// storage.
struct ComputeOpExpand {
  memory::vector<std::size_t> axes;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOpExpand> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpExpand &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{axes=[{}]}}", fmt::join(op.axes, ", "));
  }
};
