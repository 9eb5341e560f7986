#include "tessera/graph/Graph.hpp"
#include <fmt/format.h>

namespace tessera::graph {

memory::string Graph::to_string() const {
  const auto &cb = *m_controlBlock;
  memory::string str = fmt::format("Graph ({} nodes)\n", cb.nodes.size());
  for (const auto &node : cb.nodes) {
    str.append(fmt::format("  {} = {}({}) : {}", node.id, node.op,
                           fmt::join(node.inputs, ", "), node.shape));
    if (node.op.isView()) {
      str.append(fmt::format("  view {} of {}", node.view, node.storage));
    }
    str.push_back('\n');
  }
  if (!cb.obligations.empty()) {
    str.append("deferred:\n");
    for (const auto &obligation : cb.obligations) {
      str.append(fmt::format("  {}: {} == {} ({})\n", obligation.node,
                             obligation.lhs, obligation.rhs,
                             obligation.context));
    }
  }
  return str;
}

} // namespace tessera::graph
