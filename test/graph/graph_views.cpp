#include "tessera/diag/errors.hpp"
#include "tessera/graph/Graph.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace tessera;
using namespace tessera::graph;

TEST(graph, new_tensor) {
  Graph g;
  const Dim batch = g.dynamic("batch");
  GraphTensor x = g.newTensor("x", Shape{batch, Dim::Constant(8)});
  EXPECT_EQ(g.nodeCount(), 1u);
  EXPECT_EQ(x.rank(), 2u);
  EXPECT_EQ(x.shape()[0], batch);

  const ComputeNode &node = g.node(x.id());
  EXPECT_EQ(node.op.tag(), ComputeOpKind::Input);
  EXPECT_EQ(node.op.input().name, "x");
  EXPECT_TRUE(node.view.isContiguous());
  EXPECT_EQ(node.storage, x.id());
}

TEST(graph, duplicate_tensor_name) {
  Graph g;
  g.newTensor("x", Shape{Dim::Constant(4)});
  EXPECT_THROW(g.newTensor("x", Shape{Dim::Constant(4)}),
               std::invalid_argument);
  EXPECT_EQ(g.nodeCount(), 1u);
}

TEST(graph, named_tensors) {
  Graph g;
  GraphTensor x = g.newTensor("x", Shape{Dim::Constant(4)});
  g.neg(x);
  GraphTensor w = g.input("w", Shape{Dim::Constant(4), Dim::Constant(4)});

  auto named = g.namedTensors();
  ASSERT_EQ(named.size(), 2u);
  EXPECT_EQ(named[0].name, "x");
  EXPECT_EQ(named[0].tensor.id(), x.id());
  EXPECT_EQ(named[1].name, "w");
  EXPECT_EQ(named[1].tensor.shape(), w.shape());
}

TEST(graph, full_slice_keeps_shape) {
  Graph g;
  Shape shape{g.dynamic("batch"), Dim::Constant(10), g.dynamic("seq")};
  GraphTensor x = g.newTensor("x", shape);

  GraphTensor full = g.slice(x, {RangeSpec::Full(), RangeSpec::Full(),
                                 RangeSpec::Full()});
  EXPECT_EQ(full.shape(), shape);
  EXPECT_EQ(g.sliceAxis(x, 2, RangeSpec::Full()).shape(), shape);
  EXPECT_EQ(g.nodeCount(), 3u);
}

TEST(graph, partial_slice_is_dynamic) {
  Graph g;
  GraphTensor x =
      g.newTensor("x", Shape{Dim::Constant(4), Dim::Constant(10)});

  GraphTensor sliced = g.sliceAxis(x, 1, RangeSpec::Range(0, 10));
  EXPECT_TRUE(sliced.shape()[0].isConstant());
  EXPECT_TRUE(sliced.shape()[1].isDynamic());
  EXPECT_EQ(sliced.shape()[1].size(), 10);

  const ComputeNode &node = g.node(sliced.id());
  EXPECT_EQ(node.op.tag(), ComputeOpKind::Slice);
  EXPECT_EQ(node.storage, x.id());
  ASSERT_EQ(node.inputs.size(), 1u);
  EXPECT_EQ(node.inputs[0], x.id());
}

TEST(graph, nested_slice_equals_direct_slice) {
  Graph g;
  GraphTensor x = g.newTensor("x", Shape{Dim::Constant(10)});

  GraphTensor nested =
      g.slice(g.slice(x, {RangeSpec::Range(2, 8)}), {RangeSpec::Range(1, 4)});
  GraphTensor direct = g.slice(x, {RangeSpec::Range(3, 6)});

  EXPECT_EQ(nested.shape(), direct.shape());
  EXPECT_EQ(g.node(nested.id()).view, g.node(direct.id()).view);
  EXPECT_EQ(g.node(nested.id()).view.range(0).start, 3);
  EXPECT_EQ(g.node(nested.id()).view.range(0).end, 6);
}

TEST(graph, nested_slice_equals_direct_slice_dynamic) {
  Graph g;
  GraphTensor x = g.newTensor("x", Shape{g.dynamic("N")});

  GraphTensor nested =
      g.slice(g.slice(x, {RangeSpec::Range(2, 8)}), {RangeSpec::Range(1, 4)});
  GraphTensor direct = g.slice(x, {RangeSpec::Range(3, 6)});

  EXPECT_EQ(nested.shape(), direct.shape());
  EXPECT_EQ(g.node(nested.id()).view, g.node(direct.id()).view);
  EXPECT_EQ(fmt::format("{}", g.node(nested.id()).view.range(0)),
            "[3, min(6, N))");

  for (Sym::value_type n : {4, 6, 20}) {
    auto eval = g.eval({{"N", n}});
    auto lhs = nested.shape().resolve(eval);
    auto rhs = direct.shape().resolve(eval);
    ASSERT_TRUE(lhs.has_value());
    ASSERT_TRUE(rhs.has_value());
    EXPECT_EQ(*lhs, *rhs);
  }
}

TEST(graph, empty_nested_slice_of_dynamic_axis_throws) {
  Graph g;
  GraphTensor x = g.newTensor("x", Shape{g.dynamic("N")});
  GraphTensor a = g.slice(x, {RangeSpec::Range(2, 8)});
  const std::size_t before = g.nodeCount();

  // a has at most 6 elements, so [7, 9) starts past its end.
  EXPECT_THROW(g.slice(a, {RangeSpec::Range(7, 9)}), diag::InvalidRange);
  EXPECT_EQ(g.nodeCount(), before);

  // [5, 9) may be non-empty and is accepted.
  GraphTensor b = g.slice(a, {RangeSpec::Range(5, 9)});
  auto extents = b.shape().resolve(g.eval({{"N", 20}}));
  ASSERT_TRUE(extents.has_value());
  EXPECT_EQ((*extents)[0], 1);
}

TEST(graph, slice_of_dynamic_axis) {
  Graph g;
  GraphTensor x = g.newTensor("x", Shape{g.dynamic("seq")});
  GraphTensor tail = g.slice(x, {RangeSpec::From(2)});

  auto eval = g.eval({{"seq", 5}});
  auto extents = tail.shape().resolve(eval);
  ASSERT_TRUE(extents.has_value());
  EXPECT_EQ((*extents)[0], 3);
}

TEST(graph, invalid_slice_leaves_graph_unchanged) {
  Graph g;
  GraphTensor x = g.newTensor("x", Shape{Dim::Constant(10)});
  const std::size_t before = g.nodeCount();

  EXPECT_THROW(g.slice(x, {RangeSpec::Range(6, 3)}), diag::InvalidRange);
  EXPECT_THROW(g.slice(x, {RangeSpec::Range(-1, 3)}), diag::InvalidRange);
  EXPECT_THROW(g.slice(x, {RangeSpec::Full(), RangeSpec::Full()}),
               diag::InvalidRange);
  EXPECT_THROW(g.sliceAxis(x, 1, RangeSpec::Full()), diag::InvalidRange);
  EXPECT_EQ(g.nodeCount(), before);
}

TEST(graph, permute_round_trip) {
  Graph g;
  Shape shape{g.dynamic("batch"), Dim::Constant(3), g.dynamic("seq")};
  GraphTensor x = g.newTensor("x", shape);

  GraphTensor p = g.permute(x, {2, 0, 1});
  EXPECT_EQ(p.shape()[0], shape[2]);
  EXPECT_EQ(p.shape()[1], shape[0]);
  EXPECT_EQ(p.shape()[2], shape[1]);

  GraphTensor back = g.permute(p, {1, 2, 0});
  EXPECT_EQ(back.shape(), shape);
  EXPECT_EQ(g.node(back.id()).view, g.node(x.id()).view);
  EXPECT_EQ(g.node(back.id()).storage, x.id());
}

TEST(graph, invalid_permutation) {
  Graph g;
  GraphTensor x =
      g.newTensor("x", Shape{Dim::Constant(2), Dim::Constant(3)});
  EXPECT_THROW(g.permute(x, {0, 0}), diag::InvalidRange);
  EXPECT_THROW(g.permute(x, {0, 1, 2}), diag::InvalidRange);
  EXPECT_EQ(g.nodeCount(), 1u);
}

TEST(graph, concat) {
  Graph g;
  GraphTensor a = g.newTensor("a", Shape{Dim::Constant(4), Dim::Constant(3)});
  GraphTensor b = g.newTensor("b", Shape{Dim::Constant(4), Dim::Constant(5)});

  GraphTensor c = g.concat(a, b, 1);
  EXPECT_EQ(c.shape(), (Shape{Dim::Constant(4), Dim::Constant(8)}));

  GraphTensor left = g.sliceAxis(c, 1, RangeSpec::Range(0, 3));
  GraphTensor right = g.sliceAxis(c, 1, RangeSpec::Range(3, 8));
  EXPECT_EQ(left.shape()[1].size(), a.shape()[1].size());
  EXPECT_EQ(right.shape()[1].size(), b.shape()[1].size());
  EXPECT_EQ(left.shape()[0], Dim::Constant(4));
}

TEST(graph, concat_dynamic) {
  Graph g;
  const Dim seq = g.dynamic("seq");
  GraphTensor a = g.newTensor("a", Shape{seq, Dim::Constant(2)});
  GraphTensor b = g.newTensor("b", Shape{seq, Dim::Constant(2)});

  GraphTensor c = g.concat(a, b, 0);
  EXPECT_TRUE(c.shape()[0].isDynamic());
  EXPECT_EQ(c.shape()[0].size(), seq.size() * 2);
  EXPECT_EQ(c.shape()[1], Dim::Constant(2));
}

TEST(graph, concat_mismatch) {
  Graph g;
  GraphTensor a = g.newTensor("a", Shape{Dim::Constant(4), Dim::Constant(3)});
  GraphTensor b = g.newTensor("b", Shape{Dim::Constant(5), Dim::Constant(3)});
  GraphTensor v = g.newTensor("v", Shape{Dim::Constant(4)});

  EXPECT_THROW(g.concat(a, b, 1), diag::ShapeMismatch);
  EXPECT_THROW(g.concat(a, v, 0), diag::ShapeMismatch);
  EXPECT_THROW(g.concat(a, a, 2), diag::InvalidRange);
  EXPECT_EQ(g.nodeCount(), 3u);
}

TEST(graph, reshape_resolves) {
  Graph g;
  GraphTensor x = g.newTensor(
      "x", Shape{g.dynamic("batch"), g.dynamic("seq"), Dim::Constant(8)});

  GraphTensor heads =
      g.reshape(x, {ReshapeDim::PrevDim(0), ReshapeDim::PrevDim(1),
                    ReshapeDim::Const(2), ReshapeDim::Const(4)});
  EXPECT_EQ(heads.rank(), 4u);
  EXPECT_EQ(g.nodeCount(), 2u);
  EXPECT_TRUE(g.obligations().empty());

  auto eval = g.eval({{"batch", 2}, {"seq", 5}});
  auto extents = heads.shape().resolve(eval);
  ASSERT_TRUE(extents.has_value());
  EXPECT_EQ(*extents, (memory::vector<Sym::value_type>{2, 5, 2, 4}));
}

TEST(graph, reshape_element_count_mismatch) {
  Graph g;
  GraphTensor x =
      g.newTensor("x", Shape{Dim::Constant(4), Dim::Constant(6)});
  EXPECT_THROW(g.reshape(x, {ReshapeDim::Const(5), ReshapeDim::Const(5)}),
               diag::ShapeMismatch);
  EXPECT_THROW(g.reshape(x, {ReshapeDim::PrevDim(2)}), diag::InvalidRange);
  EXPECT_EQ(g.nodeCount(), 1u);
}

TEST(graph, reshape_of_strided_view_is_materialized) {
  Graph g;
  GraphTensor x =
      g.newTensor("x", Shape{Dim::Constant(4), Dim::Constant(6)});
  GraphTensor t = g.permute(x, {1, 0});

  GraphTensor flat = g.reshape(t, {ReshapeDim::Const(24)});
  EXPECT_EQ(g.nodeCount(), 4u);

  const ComputeNode &node = g.node(flat.id());
  ASSERT_EQ(node.inputs.size(), 1u);
  const ComputeNode &dense = g.node(node.inputs[0]);
  EXPECT_EQ(dense.op.tag(), ComputeOpKind::Contiguous);
  EXPECT_EQ(node.storage, dense.id);
  EXPECT_TRUE(node.view.isContiguous());
}

TEST(graph, expand) {
  Graph g;
  GraphTensor x = g.newTensor("x", Shape{Dim::Constant(4)});
  const Dim seq = g.dynamic("seq");

  GraphTensor e = g.expand(x, 0, seq);
  EXPECT_EQ(e.shape(), (Shape{seq, Dim::Constant(4)}));
  EXPECT_TRUE(g.node(e.id()).view.isFake(0));
  EXPECT_EQ(g.node(e.id()).storage, x.id());
  EXPECT_THROW(g.expand(x, 2, seq), diag::InvalidRange);
}

TEST(graph, expand_to) {
  Graph g;
  GraphTensor row =
      g.newTensor("row", Shape{Dim::Constant(1), Dim::Constant(4)});
  Shape target{g.dynamic("batch"), Dim::Constant(3), Dim::Constant(4)};

  GraphTensor e = g.expandTo(row, target);
  EXPECT_EQ(e.shape(), target);
  const ShapeTracker &view = g.node(e.id()).view;
  EXPECT_TRUE(view.isFake(0));
  EXPECT_TRUE(view.isFake(1));
  EXPECT_FALSE(view.isFake(2));

  GraphTensor wide =
      g.newTensor("wide", Shape{Dim::Constant(2), Dim::Constant(4)});
  EXPECT_THROW(g.expandTo(wide, target), diag::ShapeMismatch);
  EXPECT_THROW(g.expandTo(row, Shape{Dim::Constant(4)}), diag::ShapeMismatch);
}

TEST(graph, realize) {
  Graph g;
  GraphTensor x = g.newTensor("x", Shape{g.dynamic("seq")});
  GraphTensor tail = g.slice(x, {RangeSpec::From(1)});
  const std::size_t before = g.nodeCount();

  const Dim len = g.dynamic("len");
  GraphTensor r = g.realize(tail, Shape{len});
  EXPECT_EQ(r.id(), tail.id());
  EXPECT_EQ(r.shape(), Shape{len});
  EXPECT_EQ(g.nodeCount(), before);
  ASSERT_EQ(g.obligations().size(), 1u);
  EXPECT_EQ(g.obligations()[0].node, tail.id());

  g.checkObligations(g.eval({{"seq", 5}, {"len", 4}}));
  EXPECT_THROW(g.checkObligations(g.eval({{"seq", 5}, {"len", 5}})),
               diag::UnresolvedDynamicMismatch);
  // Obligations over unbound symbols are skipped.
  g.checkObligations(g.eval({{"seq", 5}}));
}

TEST(graph, realize_mismatch) {
  Graph g;
  GraphTensor x =
      g.newTensor("x", Shape{Dim::Constant(4), Dim::Constant(6)});
  EXPECT_THROW(g.realize(x, Shape{Dim::Constant(24)}), diag::ShapeMismatch);
  EXPECT_THROW(g.realize(x, Shape{Dim::Constant(4), Dim::Constant(5)}),
               diag::ShapeMismatch);
  EXPECT_TRUE(g.obligations().empty());

  // Equal sizes with a different classification are accepted.
  GraphTensor s = g.sliceAxis(x, 1, RangeSpec::Range(0, 6));
  GraphTensor r = g.realize(s, x.shape());
  EXPECT_EQ(r.shape(), x.shape());
  EXPECT_TRUE(g.obligations().empty());
}

TEST(graph, obligations_disabled) {
  Options options;
  options.recordObligations = false;
  Graph g{options};
  GraphTensor x = g.newTensor("x", Shape{g.dynamic("seq")});
  g.realize(x, Shape{g.dynamic("len")});
  EXPECT_TRUE(g.obligations().empty());
}

TEST(graph, node_builder) {
  Graph g;
  GraphTensor x = g.newTensor("x", Shape{Dim::Constant(4)});

  GraphTensor y =
      g.addOp(ComputeOpUnary{UnaryOp::Exp}, x.shape()).input(x).finish();
  EXPECT_EQ(g.node(y.id()).op.tag(), ComputeOpKind::Unary);
  EXPECT_EQ(g.node(y.id()).inputs[0], x.id());
  EXPECT_EQ(g.node(y.id()).storage, y.id());

  GraphTensor v = g.addOp(ComputeOpContiguous{}, x.shape())
                      .input(x)
                      .view(g.node(x.id()).view, x.id())
                      .finish();
  EXPECT_EQ(g.node(v.id()).storage, x.id());

  EXPECT_THROW(g.addOp(ComputeOpUnary{UnaryOp::Neg}, x.shape())
                   .input(memory::NodeId{42})
                   .finish(),
               std::invalid_argument);
  EXPECT_EQ(g.nodeCount(), 3u);
}

TEST(graph, unknown_node) {
  Graph g;
  EXPECT_THROW(g.node(memory::NodeId{0}), std::invalid_argument);
  EXPECT_THROW(g.node(memory::NodeId{}), std::invalid_argument);
}

TEST(graph, move_keeps_symbols_valid) {
  Graph g;
  const Dim seq = g.dynamic("seq");
  GraphTensor x = g.newTensor("x", Shape{seq, Dim::Constant(2)});

  Graph moved = std::move(g);
  GraphTensor tail = moved.slice(x, {RangeSpec::From(1)});
  auto extents = tail.shape().resolve(moved.eval({{"seq", 7}}));
  ASSERT_TRUE(extents.has_value());
  EXPECT_EQ((*extents)[0], 6);
  EXPECT_EQ((*extents)[1], 2);
}

TEST(graph, resolve_view) {
  Graph g;
  GraphTensor x = g.newTensor("x", Shape{g.dynamic("seq"), Dim::Constant(4)});
  GraphTensor t = g.permute(x, {1, 0});

  TensorView view = g.resolveView(t.id(), g.eval({{"seq", 3}}));
  EXPECT_EQ(view.id, t.id());
  auto shape = view.view.shape();
  EXPECT_EQ(shape[0], 4);
  EXPECT_EQ(shape[1], 3);
}

TEST(graph, to_string) {
  Graph g;
  GraphTensor x = g.newTensor("x", Shape{g.dynamic("seq"), Dim::Constant(4)});
  g.slice(x, {RangeSpec::To(2)});
  const std::string str = fmt::format("{}", g);
  EXPECT_NE(str.find("Graph (2 nodes)"), std::string::npos);
  EXPECT_NE(str.find("Input{name=\"x\"}"), std::string::npos);
  EXPECT_NE(str.find("(dyn(seq), 4)"), std::string::npos);
}
