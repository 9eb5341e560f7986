#include "tessera/graph/Graph.hpp"
#include "tessera/diag/errors.hpp"
#include "tessera/diag/invalid_argument.hpp"
#include "tessera/diag/logging.hpp"
#include <exception>
#include <fmt/format.h>

namespace tessera::graph {

GraphTensor Graph::function(memory::string_view name,
                            memory::span<const GraphTensor> inputs,
                            Shape declaredShape, FunctionPayload payload) {
  if (!payload) {
    diag::invalid_argument(
        fmt::format("Graph::function: \"{}\" has no payload", name));
  }
  memory::vector<memory::NodeId> ids;
  ids.reserve(inputs.size());
  for (const auto &input : inputs) {
    checked(input);
    ids.push_back(input.id());
  }
  return insert(ComputeOpFunction{memory::string(name), std::move(payload)},
                std::move(ids), std::move(declaredShape), memory::nullopt,
                memory::NodeId{});
}

FunctionResult
Graph::invokeFunction(memory::NodeId id,
                      memory::span<const FunctionInput> inputs) const {
  const ComputeNode &node = this->node(id);
  if (node.op.tag() != ComputeOpKind::Function) {
    diag::invalid_argument(
        fmt::format("Graph::invokeFunction: {} is not a function node", id));
  }
  const ComputeOpFunction &fn = node.op.function();
  if (inputs.size() != node.inputs.size()) {
    diag::invalid_argument(fmt::format(
        "Graph::invokeFunction: \"{}\" expects {} inputs, got {}", fn.name,
        node.inputs.size(), inputs.size()));
  }
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    if (inputs[i].id != node.inputs[i]) {
      diag::invalid_argument(fmt::format(
          "Graph::invokeFunction: input {} of \"{}\" is {}, got {}", i,
          fn.name, node.inputs[i], inputs[i].id));
    }
  }

  FunctionResult result;
  try {
    result = fn.payload(inputs, id);
  } catch (const diag::FunctionPayloadError &) {
    throw;
  } catch (const std::exception &e) {
    TESSERA_ERROR("function \"{}\" at {} failed: {}", fn.name, id, e.what());
    std::throw_with_nested(diag::FunctionPayloadError(
        fmt::format("function \"{}\" at {}: {}", fn.name, id, e.what())));
  }

  if (result.view.id != id) {
    diag::function_payload_error(
        "function \"{}\" at {} returned a view of {}", fn.name, id,
        result.view.id);
  }
  if (result.view.view.rank() != node.shape.rank()) {
    diag::function_payload_error(
        "function \"{}\" at {} returned a view of rank {}, declared {}",
        fn.name, id, result.view.view.rank(), node.shape);
  }
  if (result.data.has_value()) {
    auto numel = result.view.view.numel().tryConstant();
    if (numel.has_value() &&
        static_cast<std::size_t>(*numel) != result.data->data.size()) {
      diag::function_payload_error(
          "function \"{}\" at {} returned {} values for a view of {} elements",
          fn.name, id, result.data->data.size(), *numel);
    }
  }
  TESSERA_TRACE("{} = {}(...) -> {}", id, fn.name, result.view.view);
  return result;
}

} // namespace tessera::graph
