#pragma once

#include "tessera/graph/Graph.hpp"
#include "tessera/graph/GraphTensor.hpp"
#include <cstddef>

namespace tessera::graph {

// [0, 1, ..., N) with N the length of axis of peer, known only once the
// symbols of peer are bound.
GraphTensor arange(Graph &graph, const GraphTensor &peer, std::size_t axis);

// N x N additive attention mask over axis of peer: -inf strictly above the
// diagonal, 0 elsewhere.
GraphTensor causalMask(Graph &graph, const GraphTensor &peer,
                       std::size_t axis);

} // namespace tessera::graph
