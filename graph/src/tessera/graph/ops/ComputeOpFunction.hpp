#pragma once

#include "tessera/graph/TensorView.hpp"
#include "tessera/memory/container/string.hpp"
#include <fmt/core.h>

namespace tessera::graph {

struct ComputeOpFunction {
  memory::string name;
  FunctionPayload payload;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOpFunction> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpFunction &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{name=\"{}\"}}", op.name);
  }
};
