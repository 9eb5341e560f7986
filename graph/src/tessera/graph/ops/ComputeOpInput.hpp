#pragma once

#include "tessera/memory/container/string.hpp"
#include <fmt/core.h>

namespace tessera::graph {

// Named leaf tensor, its values are supplied by the caller or a checkpoint.
struct ComputeOpInput {
  memory::string name;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOpInput> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpInput &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{name=\"{}\"}}", op.name);
  }
};
