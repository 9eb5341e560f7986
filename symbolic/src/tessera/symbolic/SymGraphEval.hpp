#pragma once

#include "tessera/memory/container/optional.hpp"
#include "tessera/memory/container/string.hpp"
#include "tessera/memory/container/vector.hpp"
#include "tessera/symbolic/Sym.hpp"

namespace tessera {

class Symbolic;

struct SymSpec {
  Sym::symbol symbol;
  Sym::value_type value;
};

struct NamedSymSpec {
  memory::string name;
  Sym::value_type value;
};

// Concrete values of every expression of a SymGraph under one set of symbol
// bindings. Expressions that depend on an unbound symbol evaluate to nullopt.
class SymGraphEval {
public:
  SymGraphEval() {}
  explicit SymGraphEval(memory::vector<memory::optional<Sym::value_type>> dp)
      : m_dp(std::move(dp)) {}
  memory::optional<Sym::value_type> operator[](const Sym &sym) const;
  memory::optional<Sym::value_type> operator[](const Symbolic &s) const;

private:
  memory::vector<memory::optional<Sym::value_type>> m_dp;
};

} // namespace tessera
