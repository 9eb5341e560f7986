#include "tessera/graph/ShapeTracker.hpp"
#include "tessera/diag/errors.hpp"
#include "tessera/diag/invalid_argument.hpp"
#include <fmt/format.h>

namespace tessera::graph {

ShapeTracker::ShapeTracker(memory::vector<Symbolic> extents)
    : m_extents(std::move(extents)) {
  m_ranges.reserve(m_extents.size());
  m_order.reserve(m_extents.size());
  for (std::size_t p = 0; p < m_extents.size(); ++p) {
    m_ranges.push_back(AxisRange{Symbolic{0}, m_extents[p]});
    m_order.push_back(p);
  }
  m_fake.assign(m_extents.size(), false);
}

memory::vector<Symbolic> ShapeTracker::shape() const {
  memory::vector<Symbolic> shape;
  shape.reserve(m_order.size());
  for (std::size_t p : m_order) {
    shape.push_back(m_ranges[p].length());
  }
  return shape;
}

Symbolic ShapeTracker::numel() const {
  Symbolic numel{1};
  for (const auto &extent : shape()) {
    numel = numel * extent;
  }
  return numel;
}

bool ShapeTracker::isPermuted() const {
  for (std::size_t i = 0; i < m_order.size(); ++i) {
    if (m_order[i] != i) {
      return true;
    }
  }
  return false;
}

bool ShapeTracker::isSliced() const {
  for (std::size_t p = 0; p < m_ranges.size(); ++p) {
    if (!(m_ranges[p].start == 0) || !(m_ranges[p].end == m_extents[p])) {
      return true;
    }
  }
  return false;
}

bool ShapeTracker::hasFakeAxes() const {
  for (bool fake : m_fake) {
    if (fake) {
      return true;
    }
  }
  return false;
}

ShapeTracker ShapeTracker::slice(std::size_t axis,
                                 const AxisRange &range) const {
  if (axis >= rank()) {
    diag::invalid_range("slice of axis {} on a view of rank {}", axis, rank());
  }
  ShapeTracker out = *this;
  const std::size_t p = m_order[axis];
  out.m_ranges[p] = composeRange(m_ranges[p], range);
  return out;
}

ShapeTracker
ShapeTracker::permute(memory::span<const std::size_t> perm) const {
  if (perm.size() != rank() || !isPermutation(perm)) {
    diag::invalid_range("permutation [{}] is not a bijection over {} axes",
                        fmt::join(perm, ", "), rank());
  }
  ShapeTracker out = *this;
  for (std::size_t i = 0; i < perm.size(); ++i) {
    out.m_order[i] = m_order[perm[i]];
  }
  return out;
}

ShapeTracker ShapeTracker::expand(std::size_t axis,
                                  const Symbolic &size) const {
  if (axis > rank()) {
    diag::invalid_range("expand at axis {} on a view of rank {}", axis,
                        rank());
  }
  ShapeTracker out = *this;
  const std::size_t p = m_extents.size();
  out.m_extents.push_back(size);
  out.m_ranges.push_back(AxisRange{Symbolic{0}, size});
  out.m_fake.push_back(true);
  out.m_order.insert(out.m_order.begin() + static_cast<std::ptrdiff_t>(axis),
                     p);
  return out;
}

ShapeTracker ShapeTracker::broadcast(std::size_t axis,
                                     const Symbolic &size) const {
  if (axis >= rank()) {
    diag::invalid_range("broadcast of axis {} on a view of rank {}", axis,
                        rank());
  }
  const std::size_t p = m_order[axis];
  if (!(m_ranges[p].length() == 1)) {
    diag::shape_mismatch("cannot broadcast axis {} of extent {} to {}", axis,
                         m_ranges[p].length(), size);
  }
  ShapeTracker out = *this;
  out.m_extents[p] = size;
  out.m_ranges[p] = AxisRange{Symbolic{0}, size};
  out.m_fake[p] = true;
  return out;
}

Symbolic ShapeTracker::indexOf(memory::span<const Symbolic> index) const {
  assert(index.size() == rank());
  // Row-major strides over the physical axes that own storage.
  memory::vector<Symbolic> strides(m_extents.size(), Symbolic{0});
  Symbolic stride{1};
  for (std::size_t p = m_extents.size(); p-- > 0;) {
    if (m_fake[p]) {
      continue;
    }
    strides[p] = stride;
    stride = stride * m_extents[p];
  }
  Symbolic offset{0};
  for (std::size_t p = 0; p < m_extents.size(); ++p) {
    if (!m_fake[p]) {
      offset = offset + m_ranges[p].start * strides[p];
    }
  }
  for (std::size_t i = 0; i < index.size(); ++i) {
    const std::size_t p = m_order[i];
    if (!m_fake[p]) {
      offset = offset + index[i] * strides[p];
    }
  }
  return offset;
}

memory::vector<Sym::value_type>
ShapeTracker::resolve(const SymGraphEval &eval) const {
  memory::vector<Sym::value_type> extents;
  extents.reserve(rank());
  for (const auto &extent : shape()) {
    auto v = eval[extent];
    if (!v.has_value()) {
      diag::invalid_argument(fmt::format(
          "ShapeTracker: extent {} depends on an unbound symbol", extent));
    }
    extents.push_back(*v);
  }
  return extents;
}

ShapeTracker ShapeTracker::resolved(const SymGraphEval &eval) const {
  const auto value = [&](const Symbolic &s) -> Symbolic {
    auto v = eval[s];
    if (!v.has_value()) {
      diag::invalid_argument(fmt::format(
          "ShapeTracker: {} depends on an unbound symbol", s));
    }
    return Symbolic{*v};
  };
  ShapeTracker out = *this;
  for (std::size_t p = 0; p < m_extents.size(); ++p) {
    out.m_extents[p] = value(m_extents[p]);
    out.m_ranges[p] = AxisRange{value(m_ranges[p].start),
                                value(m_ranges[p].end)};
  }
  return out;
}

bool operator==(const ShapeTracker &lhs, const ShapeTracker &rhs) {
  return lhs.m_extents == rhs.m_extents && lhs.m_ranges == rhs.m_ranges &&
         lhs.m_fake == rhs.m_fake && lhs.m_order == rhs.m_order;
}

memory::string ShapeTracker::to_string() const {
  memory::string str = "[";
  for (std::size_t i = 0; i < m_order.size(); ++i) {
    const std::size_t p = m_order[i];
    if (i != 0) {
      str.append(", ");
    }
    if (m_fake[p]) {
      str.append(fmt::format("*{}", m_ranges[p].length()));
    } else {
      str.append(fmt::format("{}:{}/{}", p, m_ranges[p], m_extents[p]));
    }
  }
  str.append("]");
  return str;
}

} // namespace tessera::graph
