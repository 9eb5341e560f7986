#include "tessera/graph/Shape.hpp"
#include "tessera/diag/errors.hpp"
#include <fmt/format.h>

namespace tessera::graph {

bool isPermutation(memory::span<const std::size_t> perm) {
  memory::vector<bool> seen(perm.size(), false);
  for (std::size_t p : perm) {
    if (p >= perm.size() || seen[p]) {
      return false;
    }
    seen[p] = true;
  }
  return true;
}

memory::vector<Symbolic> Shape::sizes() const {
  memory::vector<Symbolic> sizes;
  sizes.reserve(m_dims.size());
  for (const auto &dim : m_dims) {
    sizes.push_back(dim.size());
  }
  return sizes;
}

Symbolic Shape::numel() const {
  Symbolic numel{1};
  for (const auto &dim : m_dims) {
    numel = numel * dim.size();
  }
  return numel;
}

bool Shape::isConstant() const {
  for (const auto &dim : m_dims) {
    if (!dim.isConstant()) {
      return false;
    }
  }
  return true;
}

Shape Shape::permute(memory::span<const std::size_t> perm) const {
  if (perm.size() != m_dims.size() || !isPermutation(perm)) {
    diag::invalid_range("permutation [{}] is not a bijection over {} axes",
                        fmt::join(perm, ", "), m_dims.size());
  }
  memory::vector<Dim> dims;
  dims.reserve(m_dims.size());
  for (std::size_t p : perm) {
    dims.push_back(m_dims[p]);
  }
  return Shape{std::move(dims)};
}

Shape Shape::with(std::size_t axis, Dim dim) const {
  assert(axis < m_dims.size());
  memory::vector<Dim> dims = m_dims;
  dims[axis] = dim;
  return Shape{std::move(dims)};
}

Shape Shape::insert(std::size_t axis, Dim dim) const {
  assert(axis <= m_dims.size());
  memory::vector<Dim> dims = m_dims;
  dims.insert(dims.begin() + static_cast<std::ptrdiff_t>(axis), dim);
  return Shape{std::move(dims)};
}

Shape Shape::erase(std::size_t axis) const {
  assert(axis < m_dims.size());
  memory::vector<Dim> dims = m_dims;
  dims.erase(dims.begin() + static_cast<std::ptrdiff_t>(axis));
  return Shape{std::move(dims)};
}

memory::optional<memory::vector<Sym::value_type>>
Shape::resolve(const SymGraphEval &eval) const {
  memory::vector<Sym::value_type> extents;
  extents.reserve(m_dims.size());
  for (const auto &dim : m_dims) {
    auto v = eval[dim.size()];
    if (!v.has_value()) {
      return memory::nullopt;
    }
    extents.push_back(*v);
  }
  return extents;
}

memory::string Shape::to_string() const {
  memory::string str = "(";
  for (std::size_t d = 0; d < m_dims.size(); ++d) {
    if (d != 0) {
      str.append(", ");
    }
    str.append(m_dims[d].to_string());
  }
  str.append(")");
  return str;
}

} // namespace tessera::graph
