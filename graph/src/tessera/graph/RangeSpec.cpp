#include "tessera/graph/RangeSpec.hpp"
#include "tessera/diag/errors.hpp"
#include "tessera/diag/unreachable.hpp"
#include <fmt/format.h>

namespace tessera::graph {

static void check_non_negative(const Symbolic &value, const char *what) {
  auto c = value.tryConstant();
  if (c.has_value() && *c < 0) {
    diag::invalid_range("negative {} bound {}", what, *c);
  }
}

// True if lhs > rhs holds for every binding of the symbols.
static bool provably_greater(const Symbolic &lhs, const Symbolic &rhs) {
  if (lhs.isConstant() && rhs.isConstant()) {
    return lhs.constant() > rhs.constant();
  }
  SymGraph *graph = lhs.graph() != nullptr ? lhs.graph() : rhs.graph();
  if (graph == nullptr) {
    return false;
  }
  if (auto delta = graph->constantDifference(*lhs, *rhs)) {
    return *delta > 0;
  }
  auto lower = graph->lowerBound(*lhs);
  auto upper = graph->upperBound(*rhs);
  return lower.has_value() && upper.has_value() && *lower > *upper;
}

memory::string RangeSpec::to_string() const {
  memory::string str;
  switch (m_start.kind) {
  case Bound::Kind::Included:
    str.append(m_start.value.to_string());
    break;
  case Bound::Kind::Excluded:
    str.append(fmt::format("{}<", m_start.value.to_string()));
    break;
  case Bound::Kind::Unbounded:
    break;
  }
  switch (m_end.kind) {
  case Bound::Kind::Included:
    str.append(fmt::format("..={}", m_end.value.to_string()));
    break;
  case Bound::Kind::Excluded:
    str.append(fmt::format("..{}", m_end.value.to_string()));
    break;
  case Bound::Kind::Unbounded:
    str.append("..");
    break;
  }
  return str;
}

Symbolic resolveStart(const Bound &bound) {
  switch (bound.kind) {
  case Bound::Kind::Included:
    return bound.value;
  case Bound::Kind::Excluded:
    return bound.value + 1;
  case Bound::Kind::Unbounded:
    return Symbolic{0};
  }
  diag::unreachable();
}

Symbolic resolveEnd(const Bound &bound, const memory::optional<Symbolic> &size,
                    Sym::value_type unboundedSentinel) {
  switch (bound.kind) {
  case Bound::Kind::Excluded:
    return bound.value;
  case Bound::Kind::Included:
    return bound.value + 1;
  case Bound::Kind::Unbounded:
    if (size.has_value()) {
      return *size;
    }
    return Symbolic{unboundedSentinel};
  }
  diag::unreachable();
}

AxisRange resolveRange(const RangeSpec &spec,
                       const memory::optional<Symbolic> &size,
                       Sym::value_type unboundedSentinel) {
  if (spec.start().kind != Bound::Kind::Unbounded) {
    check_non_negative(spec.start().value, "start");
  }
  if (spec.end().kind != Bound::Kind::Unbounded) {
    check_non_negative(spec.end().value, "end");
  }
  AxisRange range{resolveStart(spec.start()),
                  resolveEnd(spec.end(), size, unboundedSentinel)};
  if (provably_greater(range.start, range.end)) {
    diag::invalid_range("range {} resolves to start {} > end {}",
                        spec.to_string(), range.start, range.end);
  }
  return range;
}

AxisRange composeRange(const AxisRange &current, const AxisRange &relative) {
  Symbolic start = current.start + relative.start;
  Symbolic end = min(current.end, current.start + relative.end);
  if (provably_greater(start, end)) {
    diag::invalid_range("slice [{}, {}) of axis range {} is empty with start "
                        "{} > end {}",
                        relative.start, relative.end, current, start, end);
  }
  return AxisRange{start, end};
}

Dim rangeToDim(const RangeSpec &spec, const Dim &axis, const AxisRange &range) {
  if (spec.isFull()) {
    return axis;
  }
  return Dim::Dynamic(range.length());
}

ShapeSlice sliceShape(const Shape &shape, memory::span<const RangeSpec> specs,
                      Sym::value_type unboundedSentinel) {
  if (specs.size() > shape.rank()) {
    diag::invalid_range("{} range specifications for a tensor of rank {}",
                        specs.size(), shape.rank());
  }
  memory::vector<Dim> dims;
  memory::vector<AxisRange> ranges;
  dims.reserve(shape.rank());
  ranges.reserve(shape.rank());
  for (std::size_t axis = 0; axis < shape.rank(); ++axis) {
    const Dim &dim = shape[axis];
    const RangeSpec spec = axis < specs.size() ? specs[axis] : RangeSpec::Full();
    AxisRange whole{Symbolic{0}, dim.size()};
    AxisRange range =
        composeRange(whole, resolveRange(spec, dim.size(), unboundedSentinel));
    dims.push_back(rangeToDim(spec, dim, range));
    ranges.push_back(range);
  }
  return ShapeSlice{Shape{std::move(dims)}, std::move(ranges)};
}

} // namespace tessera::graph
