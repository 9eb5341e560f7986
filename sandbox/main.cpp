#include "tessera/diag/logging.hpp"
#include "tessera/graph/Graph.hpp"
#include "tessera/graph/functions.hpp"
#include <exception>
#include <fmt/format.h>

using namespace tessera;
using namespace tessera::graph;

namespace {

constexpr Sym::value_type HIDDEN = 8;
constexpr Sym::value_type HEADS = 2;
constexpr Sym::value_type HEAD_DIM = HIDDEN / HEADS;

// (B, S, hidden) -> (B, heads, S, head_dim)
GraphTensor split_heads(Graph &g, const GraphTensor &x) {
  GraphTensor heads =
      g.reshape(x, {ReshapeDim::PrevDim(0), ReshapeDim::PrevDim(1),
                    ReshapeDim::Const(HEADS), ReshapeDim::Const(HEAD_DIM)});
  return g.permute(heads, {0, 2, 1, 3});
}

GraphTensor rotate_half(Graph &g, const GraphTensor &x) {
  const std::size_t last = x.rank() - 1;
  GraphTensor x1 = g.sliceAxis(x, last, RangeSpec::To(HEAD_DIM / 2));
  GraphTensor x2 = g.sliceAxis(x, last, RangeSpec::From(HEAD_DIM / 2));
  GraphTensor rotated = g.concat(g.neg(x2), x1, last);
  return g.realize(rotated, x.shape());
}

GraphTensor rotary(Graph &g, const GraphTensor &x, const GraphTensor &cos,
                   const GraphTensor &sin) {
  return g.add(g.mul(x, g.expandTo(cos, x.shape())),
               g.mul(rotate_half(g, x), g.expandTo(sin, x.shape())));
}

} // namespace

int main() {
  Options options;
  options.logLevel = diag::LogLevel::Debug;
  Graph g{options};

  const Dim batch = g.dynamic("batch");
  const Dim seq = g.dynamic("seq");
  const Dim hidden = Dim::Constant(HIDDEN);

  GraphTensor x = g.newTensor("x", Shape{batch, seq, hidden});
  GraphTensor wq = g.newTensor("attn.wq", Shape{hidden, hidden});
  GraphTensor wk = g.newTensor("attn.wk", Shape{hidden, hidden});
  GraphTensor wv = g.newTensor("attn.wv", Shape{hidden, hidden});
  GraphTensor wo = g.newTensor("attn.wo", Shape{hidden, hidden});

  GraphTensor pos = g.expand(arange(g, x, 1), 1, Dim::Constant(HEAD_DIM));
  GraphTensor cos = g.cos(pos);
  GraphTensor sin = g.sin(pos);

  GraphTensor q = rotary(g, split_heads(g, g.matmul(x, wq)), cos, sin);
  GraphTensor k = rotary(g, split_heads(g, g.matmul(x, wk)), cos, sin);
  GraphTensor v = split_heads(g, g.matmul(x, wv));

  GraphTensor scores = g.matmul(q, g.permute(k, {0, 1, 3, 2}));
  scores = g.mul(scores, g.expandTo(g.constant(0.5f), scores.shape()));
  scores = g.add(scores, g.expandTo(causalMask(g, x, 1), scores.shape()));

  GraphTensor attn = g.matmul(g.softmax(scores, 3), v);
  GraphTensor merged =
      g.reshape(g.permute(attn, {0, 2, 1, 3}),
                {ReshapeDim::PrevDim(0), ReshapeDim::PrevDim(1),
                 ReshapeDim::Const(HIDDEN)});
  GraphTensor out = g.realize(g.matmul(merged, wo), x.shape());

  fmt::print("{}\n", g);
  fmt::print("output {}\n", out);
  for (const auto &named : g.namedTensors()) {
    fmt::print("  {} : {}\n", named.name, named.tensor.shape());
  }

  try {
    SymGraphEval eval = g.eval({{"batch", 2}, {"seq", 5}});
    g.checkObligations(eval);

    for (const auto &node : g.nodes()) {
      auto extents = node.shape.resolve(eval);
      if (!extents.has_value()) {
        TESSERA_WARN("{} has unresolved extents {}", node.id, node.shape);
        continue;
      }
      fmt::print("{} : ({})\n", node.id, fmt::join(*extents, ", "));
    }

    for (const auto &node : g.nodes()) {
      if (node.op.tag() != ComputeOpKind::Function) {
        continue;
      }
      memory::vector<FunctionInput> inputs;
      for (const auto &input : node.inputs) {
        inputs.push_back(FunctionInput{input, g.resolveView(input, eval)});
      }
      FunctionResult result = g.invokeFunction(node.id, inputs);
      fmt::print("{} {} -> {}\n", node.id, node.op.function().name,
                 result.view.view);
      if (result.data.has_value()) {
        fmt::print("  [{}]\n", fmt::join(result.data->data, ", "));
      }
    }
  } catch (const std::exception &e) {
    TESSERA_ERROR("{}", e.what());
    return 1;
  }
  return 0;
}
