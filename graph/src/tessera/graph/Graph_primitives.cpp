#include "tessera/graph/Graph.hpp"
#include "tessera/diag/errors.hpp"
#include <fmt/format.h>

namespace tessera::graph {

GraphTensor Graph::unary(const GraphTensor &src, UnaryOp op) {
  checked(src);
  return insert(ComputeOpUnary{op}, {src.id()}, src.shape(), memory::nullopt,
                memory::NodeId{});
}

GraphTensor Graph::binary(const GraphTensor &lhs, const GraphTensor &rhs,
                          BinaryOp op) {
  checked(lhs);
  checked(rhs);
  if (lhs.rank() != rhs.rank()) {
    diag::shape_mismatch("{} of {} and {}: ranks differ", op, lhs.shape(),
                         rhs.shape());
  }
  memory::vector<ShapeObligation> pending;
  memory::vector<Dim> dims;
  dims.reserve(lhs.rank());
  for (std::size_t d = 0; d < lhs.rank(); ++d) {
    const Dim &a = lhs.shape()[d];
    const Dim &b = rhs.shape()[d];
    requireEqual(a, b, pending, fmt::format("{} axis {}", op, d));
    dims.push_back(a.isDynamic() && b.isConstant() ? b : a);
  }
  return insert(ComputeOpBinary{op}, {lhs.id(), rhs.id()},
                Shape{std::move(dims)}, memory::nullopt, memory::NodeId{},
                std::move(pending));
}

GraphTensor Graph::reduce(const GraphTensor &src, std::size_t axis,
                          ReduceOp op) {
  checked(src);
  if (axis >= src.rank()) {
    diag::invalid_range("{} reduction over axis {} of a tensor of rank {}",
                        op == ReduceOp::Sum ? "sum" : "max", axis, src.rank());
  }
  return insert(ComputeOpReduce{op, axis}, {src.id()},
                src.shape().erase(axis), memory::nullopt, memory::NodeId{});
}

GraphTensor Graph::matmul(const GraphTensor &lhs, const GraphTensor &rhs) {
  checked(lhs);
  checked(rhs);
  if (lhs.rank() < 2 || rhs.rank() < 2) {
    diag::shape_mismatch("matmul of {} and {}: operands need rank >= 2",
                         lhs.shape(), rhs.shape());
  }
  const std::size_t rank = lhs.rank();
  memory::vector<ShapeObligation> pending;
  bool batched = false;
  if (rhs.rank() == 2) {
    requireEqual(lhs.shape()[rank - 1], rhs.shape()[0], pending,
                 "matmul contraction");
  } else if (rhs.rank() == rank) {
    batched = true;
    for (std::size_t d = 0; d + 2 < rank; ++d) {
      requireEqual(lhs.shape()[d], rhs.shape()[d], pending,
                   fmt::format("matmul batch axis {}", d));
    }
    requireEqual(lhs.shape()[rank - 1], rhs.shape()[rank - 2], pending,
                 "matmul contraction");
  } else {
    diag::shape_mismatch("matmul of {} and {}: ranks are incompatible",
                         lhs.shape(), rhs.shape());
  }
  Shape shape =
      lhs.shape().with(rank - 1, rhs.shape()[rhs.rank() - 1]);
  return insert(ComputeOpMatMul{batched}, {lhs.id(), rhs.id()},
                std::move(shape), memory::nullopt, memory::NodeId{},
                std::move(pending));
}

GraphTensor Graph::softmax(const GraphTensor &src, std::size_t axis) {
  if (axis >= src.rank()) {
    diag::invalid_range("softmax over axis {} of a tensor of rank {}", axis,
                        src.rank());
  }
  const Dim &dim = src.shape()[axis];
  GraphTensor peak = expand(maxReduce(src, axis), axis, dim);
  GraphTensor num = exp(sub(src, peak));
  GraphTensor denom = expand(sumReduce(num, axis), axis, dim);
  return div(num, denom);
}

} // namespace tessera::graph
