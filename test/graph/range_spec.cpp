#include "tessera/diag/errors.hpp"
#include "tessera/graph/Options.hpp"
#include "tessera/graph/RangeSpec.hpp"
#include "tessera/graph/Shape.hpp"
#include "tessera/symbolic/SymGraph.hpp"
#include "tessera/symbolic/Symbolic.hpp"
#include <cstdint>
#include <gtest/gtest.h>
#include <limits>

using namespace tessera;
using namespace tessera::graph;

static constexpr Sym::value_type SENTINEL = 1 << 30;

static void expect_range(const AxisRange &range, Sym::value_type start,
                         Sym::value_type end) {
  ASSERT_TRUE(range.start.isConstant());
  ASSERT_TRUE(range.end.isConstant());
  EXPECT_EQ(range.start.constant(), start);
  EXPECT_EQ(range.end.constant(), end);
}

TEST(range_spec, bound_translation) {
  const Symbolic N{10};
  expect_range(resolveRange(RangeSpec::Range(2, 5), N, SENTINEL), 2, 5);
  expect_range(resolveRange(RangeSpec::RangeInclusive(2, 5), N, SENTINEL), 2,
               6);
  expect_range(resolveRange(RangeSpec::From(3), N, SENTINEL), 3, 10);
  expect_range(resolveRange(RangeSpec::To(4), N, SENTINEL), 0, 4);
  expect_range(resolveRange(RangeSpec::ToInclusive(4), N, SENTINEL), 0, 5);
  expect_range(resolveRange(RangeSpec::Full(), N, SENTINEL), 0, 10);
}

TEST(range_spec, excluded_start) {
  auto spec = RangeSpec::Bounds(Bound::Excluded(2), Bound::Unbounded());
  expect_range(resolveRange(spec, Symbolic{10}, SENTINEL), 3, 10);
}

TEST(range_spec, unknown_size_uses_sentinel) {
  expect_range(resolveRange(RangeSpec::From(3), memory::nullopt, SENTINEL), 3,
               SENTINEL);
}

TEST(range_spec, default_sentinel_from_options) {
  const Options options;
  expect_range(resolveRange(RangeSpec::From(3), memory::nullopt,
                            options.unboundedSentinel),
               3, std::numeric_limits<std::int32_t>::max());
}

TEST(range_spec, symbolic_size) {
  SymGraph symGraph;
  Symbolic seq(&symGraph, symGraph.var("seq"));
  AxisRange range = resolveRange(RangeSpec::From(2), seq, SENTINEL);
  EXPECT_EQ(range.start, 2);
  EXPECT_EQ(range.end, seq);
  EXPECT_EQ(range.length(), seq - 2);
}

TEST(range_spec, start_after_end_throws) {
  EXPECT_THROW(resolveRange(RangeSpec::Range(6, 3), Symbolic{10}, SENTINEL),
               diag::InvalidRange);
}

TEST(range_spec, negative_bound_throws) {
  EXPECT_THROW(resolveRange(RangeSpec::Range(-1, 3), Symbolic{10}, SENTINEL),
               diag::InvalidRange);
  EXPECT_THROW(resolveRange(RangeSpec::To(-2), Symbolic{10}, SENTINEL),
               diag::InvalidRange);
}

TEST(range_spec, symbolic_start_after_end_throws) {
  SymGraph symGraph;
  Symbolic n(&symGraph, symGraph.var("n"));
  EXPECT_THROW(resolveRange(RangeSpec::Range(n + 2, n), Symbolic{10}, SENTINEL),
               diag::InvalidRange);
  // Not provably empty.
  expect_range(resolveRange(RangeSpec::Range(0, 0), Symbolic{10}, SENTINEL), 0,
               0);
}

TEST(range_spec, compose_range) {
  expect_range(composeRange(AxisRange{2, 8}, AxisRange{1, 4}), 3, 6);
  // The end is clamped to the current range.
  expect_range(composeRange(AxisRange{2, 8}, AxisRange{1, 20}), 3, 8);
  EXPECT_THROW(composeRange(AxisRange{2, 4}, AxisRange{5, 6}),
               diag::InvalidRange);
}

TEST(range_spec, compose_range_symbolic) {
  SymGraph symGraph;
  Symbolic N(&symGraph, symGraph.var("N"));
  AxisRange whole{0, N};
  AxisRange nested =
      composeRange(composeRange(whole, AxisRange{2, 8}), AxisRange{1, 4});
  AxisRange direct = composeRange(whole, AxisRange{3, 6});
  EXPECT_EQ(nested, direct);
  EXPECT_EQ(fmt::format("{}", nested), "[3, min(6, N))");
}

TEST(range_spec, compose_range_uses_min_bounds) {
  SymGraph symGraph;
  Symbolic N(&symGraph, symGraph.var("N"));
  // At most 6 elements, whatever N is bound to.
  AxisRange current{0, min(N, Symbolic{8}) - 2};
  EXPECT_THROW(composeRange(current, AxisRange{7, 9}), diag::InvalidRange);

  AxisRange tail = composeRange(current, AxisRange{5, 9});
  EXPECT_EQ(tail.start, 5);
  EXPECT_EQ(tail.end, min(N - 2, Symbolic{6}));
}

TEST(range_spec, range_to_dim) {
  const Dim axis = Dim::Constant(10);
  EXPECT_EQ(rangeToDim(RangeSpec::Full(), axis, AxisRange{0, 10}), axis);

  Dim sliced = rangeToDim(RangeSpec::Range(0, 10), axis, AxisRange{0, 10});
  EXPECT_TRUE(sliced.isDynamic());
  EXPECT_EQ(sliced.size(), 10);
}

TEST(range_spec, slice_shape) {
  SymGraph symGraph;
  const Dim batch = Dim::Dynamic(Symbolic(&symGraph, symGraph.var("batch")));
  Shape shape{batch, Dim::Constant(10), Dim::Constant(4)};

  const RangeSpec specs[] = {RangeSpec::Full(), RangeSpec::Range(2, 5)};
  ShapeSlice sliced = sliceShape(shape, specs, SENTINEL);
  ASSERT_EQ(sliced.shape.rank(), 3u);
  EXPECT_EQ(sliced.shape[0], batch);
  EXPECT_TRUE(sliced.shape[1].isDynamic());
  EXPECT_EQ(sliced.shape[1].size(), 3);
  EXPECT_EQ(sliced.shape[2], Dim::Constant(4));
  expect_range(sliced.ranges[1], 2, 5);
  expect_range(sliced.ranges[2], 0, 4);
}

TEST(range_spec, slice_shape_too_many_specs) {
  Shape shape{Dim::Constant(4)};
  const RangeSpec specs[] = {RangeSpec::Full(), RangeSpec::Full()};
  EXPECT_THROW(sliceShape(shape, specs, SENTINEL), diag::InvalidRange);
}

TEST(range_spec, to_string) {
  EXPECT_EQ(RangeSpec::Range(2, 5).to_string(), "2..5");
  EXPECT_EQ(RangeSpec::RangeInclusive(2, 5).to_string(), "2..=5");
  EXPECT_EQ(RangeSpec::From(3).to_string(), "3..");
  EXPECT_EQ(RangeSpec::To(4).to_string(), "..4");
  EXPECT_EQ(RangeSpec::Full().to_string(), "..");
}
