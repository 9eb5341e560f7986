#pragma once

#include "tessera/graph/Dim.hpp"
#include "tessera/graph/Shape.hpp"
#include "tessera/memory/container/optional.hpp"
#include "tessera/memory/container/span.hpp"
#include "tessera/memory/container/string.hpp"
#include "tessera/memory/container/vector.hpp"
#include "tessera/symbolic/Symbolic.hpp"
#include <fmt/core.h>

namespace tessera::graph {

struct Bound {
  enum class Kind {
    Included,
    Excluded,
    Unbounded,
  };

  static Bound Included(Symbolic value) { return Bound{Kind::Included, value}; }
  static Bound Excluded(Symbolic value) { return Bound{Kind::Excluded, value}; }
  static Bound Unbounded() { return Bound{Kind::Unbounded, Symbolic{}}; }

  Kind kind;
  Symbolic value;
};

// Per-axis slice request: a start and an end bound, each inclusive, exclusive
// or absent.
class RangeSpec {
public:
  // ..
  static RangeSpec Full() {
    return RangeSpec{Bound::Unbounded(), Bound::Unbounded()};
  }
  // start..
  static RangeSpec From(Symbolic start) {
    return RangeSpec{Bound::Included(start), Bound::Unbounded()};
  }
  // ..end
  static RangeSpec To(Symbolic end) {
    return RangeSpec{Bound::Unbounded(), Bound::Excluded(end)};
  }
  // ..=end
  static RangeSpec ToInclusive(Symbolic end) {
    return RangeSpec{Bound::Unbounded(), Bound::Included(end)};
  }
  // start..end
  static RangeSpec Range(Symbolic start, Symbolic end) {
    return RangeSpec{Bound::Included(start), Bound::Excluded(end)};
  }
  // start..=end
  static RangeSpec RangeInclusive(Symbolic start, Symbolic end) {
    return RangeSpec{Bound::Included(start), Bound::Included(end)};
  }

  static RangeSpec Bounds(Bound start, Bound end) {
    return RangeSpec{start, end};
  }

  const Bound &start() const { return m_start; }
  const Bound &end() const { return m_end; }

  bool isFull() const {
    return m_start.kind == Bound::Kind::Unbounded &&
           m_end.kind == Bound::Kind::Unbounded;
  }

  memory::string to_string() const;

private:
  RangeSpec(Bound start, Bound end) : m_start(start), m_end(end) {}

  Bound m_start;
  Bound m_end;
};

// Canonical half-open interval [start, end).
struct AxisRange {
  Symbolic start;
  Symbolic end;

  Symbolic length() const { return end - start; }

  friend bool operator==(const AxisRange &lhs, const AxisRange &rhs) {
    return lhs.start == rhs.start && lhs.end == rhs.end;
  }
};

// Inclusive x -> x, exclusive x -> x + 1, unbounded -> 0.
Symbolic resolveStart(const Bound &bound);

// Exclusive x -> x, inclusive x -> x + 1, unbounded -> size or the sentinel
// if the size is not known.
Symbolic resolveEnd(const Bound &bound, const memory::optional<Symbolic> &size,
                    Sym::value_type unboundedSentinel);

// Translates a range specification into [start, end). Negative literal bounds
// and literal start > end throw InvalidRange.
AxisRange resolveRange(const RangeSpec &spec,
                       const memory::optional<Symbolic> &size,
                       Sym::value_type unboundedSentinel);

// Narrows the current range of an axis by a range given relative to it:
// [s0 + a, min(e0, s0 + b)). Throws InvalidRange if the result provably has
// start > end.
AxisRange composeRange(const AxisRange &current, const AxisRange &relative);

// A full range keeps the axis dimension, anything else becomes dynamic with
// the length of the resulting range.
Dim rangeToDim(const RangeSpec &spec, const Dim &axis, const AxisRange &range);

struct ShapeSlice {
  Shape shape;
  memory::vector<AxisRange> ranges;
};

// Maps one range specification per axis over a shape. Missing trailing
// specifications are full ranges.
ShapeSlice sliceShape(const Shape &shape, memory::span<const RangeSpec> specs,
                      Sym::value_type unboundedSentinel);

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::RangeSpec> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::RangeSpec &spec, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", spec.to_string());
  }
};

template <> struct fmt::formatter<tessera::graph::AxisRange> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::AxisRange &range,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "[{}, {})", range.start, range.end);
  }
};
