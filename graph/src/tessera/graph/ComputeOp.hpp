#pragma once

#include "tessera/graph/ops/ComputeOpBinary.hpp"
#include "tessera/graph/ops/ComputeOpConcat.hpp"
#include "tessera/graph/ops/ComputeOpConstant.hpp"
#include "tessera/graph/ops/ComputeOpContiguous.hpp"
#include "tessera/graph/ops/ComputeOpExpand.hpp"
#include "tessera/graph/ops/ComputeOpFunction.hpp"
#include "tessera/graph/ops/ComputeOpInput.hpp"
#include "tessera/graph/ops/ComputeOpMatMul.hpp"
#include "tessera/graph/ops/ComputeOpPermute.hpp"
#include "tessera/graph/ops/ComputeOpReduce.hpp"
#include "tessera/graph/ops/ComputeOpReshape.hpp"
#include "tessera/graph/ops/ComputeOpSlice.hpp"
#include "tessera/graph/ops/ComputeOpUnary.hpp"
#include "tessera/diag/unreachable.hpp"
#include <cassert>
#include <fmt/core.h>
#include <utility>
#include <variant>

namespace tessera::graph {

enum class ComputeOpKind {
  None,
  Input,
  Constant,
  Function,
  Slice,
  Permute,
  Expand,
  Reshape,
  Contiguous,
  Concat,
  Unary,
  Binary,
  Reduce,
  MatMul,
};

class ComputeOp {
public:
  ComputeOp() = default;

  ComputeOp(ComputeOpInput input) : m_var(std::move(input)) {}

  ComputeOp(ComputeOpConstant constant) : m_var(std::move(constant)) {}

  ComputeOp(ComputeOpFunction function) : m_var(std::move(function)) {}

  ComputeOp(ComputeOpSlice slice) : m_var(std::move(slice)) {}

  ComputeOp(ComputeOpPermute permute) : m_var(std::move(permute)) {}

  ComputeOp(ComputeOpExpand expand) : m_var(std::move(expand)) {}

  ComputeOp(ComputeOpReshape reshape) : m_var(std::move(reshape)) {}

  ComputeOp(ComputeOpContiguous contiguous) : m_var(std::move(contiguous)) {}

  ComputeOp(ComputeOpConcat concat) : m_var(std::move(concat)) {}

  ComputeOp(ComputeOpUnary unary) : m_var(std::move(unary)) {}

  ComputeOp(ComputeOpBinary binary) : m_var(std::move(binary)) {}

  ComputeOp(ComputeOpReduce reduce) : m_var(std::move(reduce)) {}

  ComputeOp(ComputeOpMatMul matmul) : m_var(std::move(matmul)) {}

  ComputeOpKind tag() const {
    switch (m_var.index()) {
    case 0:
      return ComputeOpKind::None;
    case 1:
      return ComputeOpKind::Input;
    case 2:
      return ComputeOpKind::Constant;
    case 3:
      return ComputeOpKind::Function;
    case 4:
      return ComputeOpKind::Slice;
    case 5:
      return ComputeOpKind::Permute;
    case 6:
      return ComputeOpKind::Expand;
    case 7:
      return ComputeOpKind::Reshape;
    case 8:
      return ComputeOpKind::Contiguous;
    case 9:
      return ComputeOpKind::Concat;
    case 10:
      return ComputeOpKind::Unary;
    case 11:
      return ComputeOpKind::Binary;
    case 12:
      return ComputeOpKind::Reduce;
    case 13:
      return ComputeOpKind::MatMul;
    default:
      diag::unreachable();
    }
  }

  // Views only reinterpret the storage of their input.
  bool isView() const {
    switch (tag()) {
    case ComputeOpKind::Slice:
    case ComputeOpKind::Permute:
    case ComputeOpKind::Expand:
    case ComputeOpKind::Reshape:
      return true;
    default:
      return false;
    }
  }

  const ComputeOpInput &input() const {
    assert(std::holds_alternative<ComputeOpInput>(m_var));
    return std::get<ComputeOpInput>(m_var);
  }

  const ComputeOpConstant &constant() const {
    assert(std::holds_alternative<ComputeOpConstant>(m_var));
    return std::get<ComputeOpConstant>(m_var);
  }

  const ComputeOpFunction &function() const {
    assert(std::holds_alternative<ComputeOpFunction>(m_var));
    return std::get<ComputeOpFunction>(m_var);
  }

  const ComputeOpSlice &slice() const {
    assert(std::holds_alternative<ComputeOpSlice>(m_var));
    return std::get<ComputeOpSlice>(m_var);
  }

  const ComputeOpPermute &permute() const {
    assert(std::holds_alternative<ComputeOpPermute>(m_var));
    return std::get<ComputeOpPermute>(m_var);
  }

  const ComputeOpExpand &expand() const {
    assert(std::holds_alternative<ComputeOpExpand>(m_var));
    return std::get<ComputeOpExpand>(m_var);
  }

  const ComputeOpReshape &reshape() const {
    assert(std::holds_alternative<ComputeOpReshape>(m_var));
    return std::get<ComputeOpReshape>(m_var);
  }

  const ComputeOpContiguous &contiguous() const {
    assert(std::holds_alternative<ComputeOpContiguous>(m_var));
    return std::get<ComputeOpContiguous>(m_var);
  }

  const ComputeOpConcat &concat() const {
    assert(std::holds_alternative<ComputeOpConcat>(m_var));
    return std::get<ComputeOpConcat>(m_var);
  }

  const ComputeOpUnary &unary() const {
    assert(std::holds_alternative<ComputeOpUnary>(m_var));
    return std::get<ComputeOpUnary>(m_var);
  }

  const ComputeOpBinary &binary() const {
    assert(std::holds_alternative<ComputeOpBinary>(m_var));
    return std::get<ComputeOpBinary>(m_var);
  }

  const ComputeOpReduce &reduce() const {
    assert(std::holds_alternative<ComputeOpReduce>(m_var));
    return std::get<ComputeOpReduce>(m_var);
  }

  const ComputeOpMatMul &matmul() const {
    assert(std::holds_alternative<ComputeOpMatMul>(m_var));
    return std::get<ComputeOpMatMul>(m_var);
  }

private:
  using Variant =
      std::variant<std::monostate, ComputeOpInput, ComputeOpConstant, ComputeOpFunction, ComputeOpSlice, ComputeOpPermute, ComputeOpExpand, ComputeOpReshape, ComputeOpContiguous, ComputeOpConcat, ComputeOpUnary, ComputeOpBinary, ComputeOpReduce, ComputeOpMatMul>;

  Variant m_var;
};

} // namespace tessera::graph

template <> struct fmt::formatter<tessera::graph::ComputeOp> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const tessera::graph::ComputeOp &op, FormatContext &ctx) const {
    using tessera::graph::ComputeOpKind;

    switch (op.tag()) {
    case ComputeOpKind::None:
      return fmt::format_to(ctx.out(), "None{{}}");

    case ComputeOpKind::Input:
      return fmt::format_to(ctx.out(), "Input{}", op.input());

    case ComputeOpKind::Constant:
      return fmt::format_to(ctx.out(), "Constant{}", op.constant());

    case ComputeOpKind::Function:
      return fmt::format_to(ctx.out(), "Function{}", op.function());

    case ComputeOpKind::Slice:
      return fmt::format_to(ctx.out(), "Slice{}", op.slice());

    case ComputeOpKind::Permute:
      return fmt::format_to(ctx.out(), "Permute{}", op.permute());

    case ComputeOpKind::Expand:
      return fmt::format_to(ctx.out(), "Expand{}", op.expand());

    case ComputeOpKind::Reshape:
      return fmt::format_to(ctx.out(), "Reshape{}", op.reshape());

    case ComputeOpKind::Contiguous:
      return fmt::format_to(ctx.out(), "Contiguous{}", op.contiguous());

    case ComputeOpKind::Concat:
      return fmt::format_to(ctx.out(), "Concat{}", op.concat());

    case ComputeOpKind::Unary:
      return fmt::format_to(ctx.out(), "Unary{}", op.unary());

    case ComputeOpKind::Binary:
      return fmt::format_to(ctx.out(), "Binary{}", op.binary());

    case ComputeOpKind::Reduce:
      return fmt::format_to(ctx.out(), "Reduce{}", op.reduce());

    case ComputeOpKind::MatMul:
      return fmt::format_to(ctx.out(), "MatMul{}", op.matmul());
    }

    tessera::diag::unreachable();
  }
};
