#include "tessera/diag/errors.hpp"
#include "tessera/graph/ShapeTracker.hpp"
#include "tessera/symbolic/SymGraph.hpp"
#include "tessera/symbolic/Symbolic.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace tessera;
using namespace tessera::graph;

static ShapeTracker tracker(std::initializer_list<Sym::value_type> extents) {
  memory::vector<Symbolic> sizes;
  for (auto e : extents) {
    sizes.push_back(Symbolic{e});
  }
  return ShapeTracker{std::move(sizes)};
}

static Sym::value_type offset(const ShapeTracker &view,
                              std::initializer_list<Sym::value_type> index) {
  memory::vector<Symbolic> idx;
  for (auto i : index) {
    idx.push_back(Symbolic{i});
  }
  return view.indexOf(idx).constant();
}

TEST(shape_tracker, contiguous) {
  ShapeTracker view = tracker({4, 6});
  EXPECT_EQ(view.rank(), 2u);
  EXPECT_TRUE(view.isContiguous());
  EXPECT_EQ(view.numel(), 24);
  EXPECT_EQ(offset(view, {1, 2}), 8);
  EXPECT_EQ(view.to_string(), "[0:[0, 4)/4, 1:[0, 6)/6]");
}

TEST(shape_tracker, slice) {
  ShapeTracker view = tracker({4, 6}).slice(1, AxisRange{2, 5});
  EXPECT_TRUE(view.isSliced());
  EXPECT_FALSE(view.isContiguous());
  auto shape = view.shape();
  EXPECT_EQ(shape[0], 4);
  EXPECT_EQ(shape[1], 3);
  EXPECT_EQ(offset(view, {1, 1}), 6 + 2 + 1);
}

TEST(shape_tracker, nested_slice_equals_direct_slice) {
  ShapeTracker nested =
      tracker({10}).slice(0, AxisRange{2, 8}).slice(0, AxisRange{1, 4});
  ShapeTracker direct = tracker({10}).slice(0, AxisRange{3, 6});
  EXPECT_EQ(nested, direct);
}

TEST(shape_tracker, nested_slice_symbolic) {
  SymGraph symGraph;
  Symbolic N(&symGraph, symGraph.var("N"));
  ShapeTracker whole{memory::vector<Symbolic>{N}};

  ShapeTracker nested =
      whole.slice(0, AxisRange{2, 8}).slice(0, AxisRange{1, 4});
  ShapeTracker direct = whole.slice(0, AxisRange{3, 6});
  EXPECT_EQ(nested, direct);
  EXPECT_EQ(nested.range(0).end, min(N, Symbolic{6}));
}

TEST(shape_tracker, permute_round_trip) {
  ShapeTracker view = tracker({2, 3, 4});
  const std::size_t perm[] = {2, 0, 1};
  const std::size_t inverse[] = {1, 2, 0};

  ShapeTracker permuted = view.permute(perm);
  EXPECT_TRUE(permuted.isPermuted());
  auto shape = permuted.shape();
  EXPECT_EQ(shape[0], 4);
  EXPECT_EQ(shape[1], 2);
  EXPECT_EQ(shape[2], 3);

  EXPECT_EQ(permuted.permute(inverse), view);
}

TEST(shape_tracker, permuted_index) {
  const std::size_t perm[] = {1, 0};
  ShapeTracker view = tracker({4, 6}).permute(perm);
  EXPECT_EQ(offset(view, {2, 1}), 1 * 6 + 2);
}

TEST(shape_tracker, invalid_permutation) {
  ShapeTracker view = tracker({2, 3});
  const std::size_t duplicate[] = {0, 0};
  const std::size_t shortPerm[] = {0};
  EXPECT_THROW(view.permute(duplicate), diag::InvalidRange);
  EXPECT_THROW(view.permute(shortPerm), diag::InvalidRange);
}

TEST(shape_tracker, expand) {
  ShapeTracker view = tracker({4, 6}).expand(0, Symbolic{3});
  EXPECT_EQ(view.rank(), 3u);
  EXPECT_TRUE(view.isFake(0));
  EXPECT_FALSE(view.isFake(1));
  EXPECT_TRUE(view.hasFakeAxes());
  EXPECT_FALSE(view.isContiguous());
  EXPECT_EQ(view.numel(), 72);
  EXPECT_EQ(offset(view, {2, 1, 2}), offset(view, {0, 1, 2}));
  EXPECT_EQ(offset(view, {2, 1, 2}), 8);
  EXPECT_EQ(view.to_string(), "[*3, 0:[0, 4)/4, 1:[0, 6)/6]");
}

TEST(shape_tracker, broadcast) {
  ShapeTracker view = tracker({1, 6}).broadcast(0, Symbolic{5});
  EXPECT_TRUE(view.isFake(0));
  EXPECT_EQ(view.shape()[0], 5);
  EXPECT_EQ(offset(view, {3, 4}), 4);

  EXPECT_THROW(tracker({2, 6}).broadcast(0, Symbolic{5}), diag::ShapeMismatch);
}

TEST(shape_tracker, axis_out_of_range) {
  ShapeTracker view = tracker({2, 3});
  EXPECT_THROW(view.slice(2, AxisRange{0, 1}), diag::InvalidRange);
  EXPECT_THROW(view.expand(3, Symbolic{1}), diag::InvalidRange);
}

TEST(shape_tracker, resolve) {
  SymGraph symGraph;
  Symbolic B(&symGraph, symGraph.var("B"));
  ShapeTracker view{memory::vector<Symbolic>{B, Symbolic{8}}};
  view = view.slice(1, AxisRange{2, 6});

  memory::vector<NamedSymSpec> specs;
  specs.push_back(NamedSymSpec{"B", 3});
  auto eval = symGraph.eval(specs);

  auto extents = view.resolve(eval);
  ASSERT_EQ(extents.size(), 2u);
  EXPECT_EQ(extents[0], 3);
  EXPECT_EQ(extents[1], 4);

  ShapeTracker resolved = view.resolved(eval);
  EXPECT_EQ(resolved.extent(0), 3);
  EXPECT_EQ(resolved.range(1).start, 2);
  EXPECT_EQ(resolved.numel().constant(), 12);

  EXPECT_THROW(view.resolve(symGraph.eval(memory::vector<SymSpec>{})),
               std::invalid_argument);
}
