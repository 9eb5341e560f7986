#pragma once

#include "tessera/memory/container/vector.hpp"
#include <cstddef>
#include <fmt/format.h>

namespace tessera::graph {

struct ComputeOpPermute {
  memory::vector<std::size_t> perm;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOpPermute> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOpPermute &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{{perm=[{}]}}", fmt::join(op.perm, ", "));
  }
};
