#include "tessera/graph/Graph.hpp"
#include "tessera/diag/errors.hpp"
#include "tessera/diag/invalid_argument.hpp"
#include <fmt/format.h>

namespace tessera::graph {

GraphTensor Graph::slice(const GraphTensor &src,
                         memory::span<const RangeSpec> ranges) {
  const ComputeNode &in = checked(src);
  ShapeSlice sliced = sliceShape(src.shape(), ranges,
                                 m_controlBlock->options.unboundedSentinel);
  ShapeTracker view = in.view;
  for (std::size_t axis = 0; axis < sliced.ranges.size(); ++axis) {
    view = view.slice(axis, sliced.ranges[axis]);
  }
  return insert(ComputeOpSlice{memory::vector<RangeSpec>(ranges.begin(),
                                                         ranges.end())},
                {src.id()}, std::move(sliced.shape), std::move(view),
                in.storage);
}

GraphTensor Graph::sliceAxis(const GraphTensor &src, std::size_t axis,
                             const RangeSpec &range) {
  if (axis >= src.rank()) {
    diag::invalid_range("slice of axis {} on a tensor of rank {}", axis,
                        src.rank());
  }
  memory::vector<RangeSpec> ranges(axis, RangeSpec::Full());
  ranges.push_back(range);
  return slice(src, ranges);
}

GraphTensor Graph::permute(const GraphTensor &src,
                           memory::span<const std::size_t> perm) {
  const ComputeNode &in = checked(src);
  Shape shape = src.shape().permute(perm);
  ShapeTracker view = in.view.permute(perm);
  return insert(ComputeOpPermute{memory::vector<std::size_t>(perm.begin(),
                                                             perm.end())},
                {src.id()}, std::move(shape), std::move(view), in.storage);
}

GraphTensor Graph::expand(const GraphTensor &src, std::size_t axis,
                          const Dim &dim) {
  const ComputeNode &in = checked(src);
  if (axis > src.rank()) {
    diag::invalid_range("expand at axis {} on a tensor of rank {}", axis,
                        src.rank());
  }
  Shape shape = src.shape().insert(axis, dim);
  ShapeTracker view = in.view.expand(axis, dim.size());
  return insert(ComputeOpExpand{{axis}}, {src.id()}, std::move(shape),
                std::move(view), in.storage);
}

GraphTensor Graph::expandTo(const GraphTensor &src, const Shape &target) {
  const ComputeNode &in = checked(src);
  if (target.rank() < src.rank()) {
    diag::shape_mismatch("cannot expand {} to the lower rank shape {}",
                         src.shape(), target);
  }
  const std::size_t offset = target.rank() - src.rank();
  ShapeTracker view = in.view;
  memory::vector<std::size_t> axes;
  memory::vector<ShapeObligation> pending;
  for (std::size_t axis = 0; axis < offset; ++axis) {
    view = view.expand(axis, target[axis].size());
    axes.push_back(axis);
  }
  for (std::size_t i = 0; i < src.rank(); ++i) {
    const std::size_t axis = offset + i;
    const Dim &have = src.shape()[i];
    const Dim &want = target[axis];
    if (have.size() == want.size()) {
      continue;
    }
    if (have.tryConstant() == 1) {
      view = view.broadcast(axis, want.size());
      axes.push_back(axis);
      continue;
    }
    requireEqual(have, want, pending,
                 fmt::format("expand of axis {} to {}", i, target));
  }
  return insert(ComputeOpExpand{std::move(axes)}, {src.id()}, target,
                std::move(view), in.storage, std::move(pending));
}

GraphTensor Graph::reshape(const GraphTensor &src,
                           memory::span<const ReshapeDim> dims) {
  const ComputeNode &in = checked(src);
  memory::vector<Dim> out;
  out.reserve(dims.size());
  for (const auto &dim : dims) {
    switch (dim.kind()) {
    case ReshapeDim::Kind::Const:
      if (dim.constant() < 0) {
        diag::invalid_range("reshape to negative extent {}", dim.constant());
      }
      out.push_back(Dim::Constant(dim.constant()));
      break;
    case ReshapeDim::Kind::PrevDim:
      if (dim.prevDim() >= src.rank()) {
        diag::invalid_range("reshape refers to axis {} of a tensor of rank {}",
                            dim.prevDim(), src.rank());
      }
      out.push_back(src.shape()[dim.prevDim()]);
      break;
    }
  }
  Shape shape{std::move(out)};

  memory::vector<ShapeObligation> pending;
  const Symbolic before = src.shape().numel();
  const Symbolic after = shape.numel();
  if (!(before == after)) {
    if (before.isConstant() && after.isConstant()) {
      diag::shape_mismatch("cannot reshape {} ({} elements) to {} ({} "
                           "elements)",
                           src.shape(), before, shape, after);
    }
    if (m_controlBlock->options.recordObligations) {
      pending.push_back(ShapeObligation{before, after, memory::NodeId{},
                                        fmt::format("reshape {} to {}",
                                                    src.shape(), shape)});
    }
  }

  memory::NodeId source = src.id();
  memory::NodeId storage = in.storage;
  if (!in.view.isContiguous()) {
    // Strided or broadcast views are materialized before the reshape.
    GraphTensor dense = insert(ComputeOpContiguous{}, {src.id()}, src.shape(),
                               memory::nullopt, memory::NodeId{});
    source = dense.id();
    storage = dense.id();
  }
  ShapeTracker view = ShapeTracker::contiguous(shape);
  return insert(ComputeOpReshape{memory::vector<ReshapeDim>(dims.begin(),
                                                            dims.end())},
                {source}, std::move(shape), std::move(view), storage,
                std::move(pending));
}

GraphTensor Graph::contiguous(const GraphTensor &src) {
  checked(src);
  return insert(ComputeOpContiguous{}, {src.id()}, src.shape(),
                memory::nullopt, memory::NodeId{});
}

GraphTensor Graph::concat(memory::span<const GraphTensor> srcs,
                          std::size_t axis) {
  if (srcs.empty()) {
    diag::invalid_argument("Graph::concat: no inputs");
  }
  const std::size_t rank = srcs[0].rank();
  if (axis >= rank) {
    diag::invalid_range("concat along axis {} of tensors of rank {}", axis,
                        rank);
  }
  memory::vector<memory::NodeId> inputs;
  inputs.reserve(srcs.size());
  for (const auto &src : srcs) {
    checked(src);
    if (src.rank() != rank) {
      diag::shape_mismatch("concat of {} with {}: ranks differ", srcs[0].shape(),
                           src.shape());
    }
    inputs.push_back(src.id());
  }

  memory::vector<ShapeObligation> pending;
  for (std::size_t d = 0; d < rank; ++d) {
    if (d == axis) {
      continue;
    }
    for (std::size_t i = 1; i < srcs.size(); ++i) {
      requireEqual(srcs[0].shape()[d], srcs[i].shape()[d], pending,
                   fmt::format("concat axis {}", d));
    }
  }

  Symbolic length = srcs[0].shape()[axis].size();
  bool constant = srcs[0].shape()[axis].isConstant();
  for (std::size_t i = 1; i < srcs.size(); ++i) {
    length = length + srcs[i].shape()[axis].size();
    constant = constant && srcs[i].shape()[axis].isConstant();
  }
  const Dim dim = constant ? Dim::Constant(length.constant())
                           : Dim::Dynamic(length);
  return insert(ComputeOpConcat{axis}, std::move(inputs),
                srcs[0].shape().with(axis, dim), memory::nullopt,
                memory::NodeId{}, std::move(pending));
}

GraphTensor Graph::realize(const GraphTensor &src, const Shape &shape) {
  checked(src);
  if (shape.rank() != src.rank()) {
    diag::shape_mismatch("cannot realize {} as {}: ranks differ", src.shape(),
                         shape);
  }
  memory::vector<ShapeObligation> pending;
  for (std::size_t d = 0; d < shape.rank(); ++d) {
    requireEqual(src.shape()[d], shape[d], pending,
                 fmt::format("realize axis {}", d));
  }
  defer(src.id(), std::move(pending));
  return GraphTensor{src.id(), shape};
}

} // namespace tessera::graph
