#pragma once

#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <limits>

namespace tessera::memory {

// Index of a node inside an append-only node arena.
struct NodeId {
public:
  static constexpr std::uint64_t NullId{
      std::numeric_limits<std::uint64_t>::max()};

  explicit constexpr NodeId() : m_id(NullId) {}
  explicit constexpr NodeId(std::uint64_t id) : m_id(id) {}

  constexpr explicit operator std::uint64_t() const { return m_id; }

  constexpr explicit operator bool() const { return m_id != NullId; }

  constexpr std::uint64_t operator*() const { return m_id; }

  constexpr std::size_t index() const {
    return static_cast<std::size_t>(m_id);
  }

  friend bool operator==(const NodeId &lhs, const NodeId &rhs) {
    return lhs.m_id == rhs.m_id;
  }

  friend bool operator!=(const NodeId &lhs, const NodeId &rhs) {
    return lhs.m_id != rhs.m_id;
  }

  friend bool operator<(const NodeId &lhs, const NodeId &rhs) {
    return lhs.m_id < rhs.m_id;
  }

private:
  std::uint64_t m_id;
};

} // namespace tessera::memory

template <> struct std::hash<tessera::memory::NodeId> {
  std::size_t operator()(const tessera::memory::NodeId &id) const noexcept {
    return std::hash<std::uint64_t>{}(*id);
  }
};

template <> struct fmt::formatter<tessera::memory::NodeId> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::memory::NodeId &nid, FormatContext &ctx) const {
    if (!nid) {
      return fmt::format_to(ctx.out(), "%null");
    }
    return fmt::format_to(ctx.out(), "%{}", *nid);
  }
};
