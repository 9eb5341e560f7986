#pragma once

#include <optional>

namespace tessera::memory {

template <typename T> using optional = std::optional<T>;
static constexpr std::nullopt_t nullopt = std::nullopt;

} // namespace tessera::memory
