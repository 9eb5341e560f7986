#include "tessera/memory/container/vector.hpp"
#include "tessera/symbolic/SymGraph.hpp"
#include "tessera/symbolic/Symbolic.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace tessera;

TEST(symbolic, eval_simple_add) {
  SymGraph symGraph;
  auto X = symGraph.var();

  auto xp1 = symGraph.add(X, 1);

  memory::vector<SymSpec> specs;
  specs.push_back(SymSpec{X.sym(), 1});
  auto eval = symGraph.eval(specs);

  EXPECT_EQ(*eval[xp1], 1 + 1);
}

TEST(symbolic, eval_affine_combination) {
  SymGraph symGraph;
  auto X = symGraph.var();
  auto Y = symGraph.var();

  auto expr = symGraph.sub(symGraph.add(symGraph.mul(X, 3), Y), 7);

  memory::vector<SymSpec> specs;
  specs.push_back(SymSpec{X.sym(), 4});
  specs.push_back(SymSpec{Y.sym(), -2});
  auto eval = symGraph.eval(specs);

  EXPECT_EQ(*eval[expr], 3 * 4 - 2 - 7);
}

TEST(symbolic, eval_floor_div_and_mod) {
  SymGraph symGraph;
  auto X = symGraph.var();

  auto q = symGraph.div(X, 2);
  auto r = symGraph.mod(X, 2);

  memory::vector<SymSpec> specs;
  specs.push_back(SymSpec{X.sym(), -7});
  auto eval = symGraph.eval(specs);

  EXPECT_EQ(*eval[q], -4);
  EXPECT_EQ(*eval[r], 1);
}

TEST(symbolic, eval_nonaffine_product) {
  SymGraph symGraph;
  auto X = symGraph.var();
  auto Y = symGraph.var();

  auto numel = symGraph.add(symGraph.mul(symGraph.mul(X, Y), 8), X);

  memory::vector<SymSpec> specs;
  specs.push_back(SymSpec{X.sym(), 2});
  specs.push_back(SymSpec{Y.sym(), 5});
  auto eval = symGraph.eval(specs);

  EXPECT_EQ(*eval[numel], 2 * 5 * 8 + 2);
}

TEST(symbolic, eval_symbolic_divisor) {
  SymGraph symGraph;
  auto X = symGraph.var();
  auto Y = symGraph.var();

  auto q = symGraph.div(X, Y);
  auto r = symGraph.mod(X, Y);

  memory::vector<SymSpec> specs;
  specs.push_back(SymSpec{X.sym(), 17});
  specs.push_back(SymSpec{Y.sym(), 5});
  auto eval = symGraph.eval(specs);

  EXPECT_EQ(*eval[q], 3);
  EXPECT_EQ(*eval[r], 2);
}

TEST(symbolic, eval_min_max) {
  SymGraph symGraph;
  auto N = symGraph.var();

  auto lo = symGraph.min(symGraph.min(N, 8), 6);
  auto hi = symGraph.max(N, 3);

  memory::vector<SymSpec> small;
  small.push_back(SymSpec{N.sym(), 4});
  auto e1 = symGraph.eval(small);
  EXPECT_EQ(*e1[lo], 4);
  EXPECT_EQ(*e1[hi], 4);

  memory::vector<SymSpec> large;
  large.push_back(SymSpec{N.sym(), 10});
  auto e2 = symGraph.eval(large);
  EXPECT_EQ(*e2[lo], 6);
  EXPECT_EQ(*e2[hi], 10);
}

TEST(symbolic, eval_unbound_symbol) {
  SymGraph symGraph;
  auto X = symGraph.var();
  auto Y = symGraph.var();

  auto expr = symGraph.add(X, Y);
  auto onlyX = symGraph.add(X, 2);

  memory::vector<SymSpec> specs;
  specs.push_back(SymSpec{X.sym(), 1});
  auto eval = symGraph.eval(specs);

  EXPECT_FALSE(eval[expr].has_value());
  EXPECT_FALSE(eval[Y].has_value());
  EXPECT_EQ(*eval[onlyX], 3);
  EXPECT_EQ(*eval[Sym::Const(9)], 9);
}

TEST(symbolic, eval_named) {
  SymGraph symGraph;
  Symbolic batch(&symGraph, symGraph.var("batch"));
  Symbolic seq(&symGraph, symGraph.var("seq"));

  Symbolic tokens = batch * seq;

  memory::vector<NamedSymSpec> specs;
  specs.push_back(NamedSymSpec{"batch", 2});
  specs.push_back(NamedSymSpec{"seq", 5});
  auto eval = symGraph.eval(specs);

  EXPECT_EQ(*eval[tokens], 10);
  EXPECT_EQ(*eval[tokens * 8 - seq], 75);
}

TEST(symbolic, eval_rejects_unknown_names) {
  SymGraph symGraph;
  symGraph.var("batch");

  memory::vector<NamedSymSpec> specs;
  specs.push_back(NamedSymSpec{"heads", 2});
  EXPECT_THROW(symGraph.eval(specs), std::invalid_argument);
}

TEST(symbolic, eval_rejects_derived_expressions) {
  SymGraph symGraph;
  auto X = symGraph.var();
  auto xp1 = symGraph.add(X, 1);

  memory::vector<SymSpec> specs;
  specs.push_back(SymSpec{xp1.sym(), 3});
  EXPECT_THROW(symGraph.eval(specs), std::invalid_argument);

  memory::vector<SymSpec> outOfRange;
  outOfRange.push_back(SymSpec{1000, 3});
  EXPECT_THROW(symGraph.eval(outOfRange), std::invalid_argument);
}
