// rpyflow/model/flow_graph.cpp - FlowGraph implementation
//
#include "rpyflow/model/flow_graph.hpp"

#include <utility>

namespace rpyflow
{

std::string_view to_string(NodeKind kind)
{
  switch (kind) {
    case NodeKind::Container:
      return "Container";
    case NodeKind::Dialogue:
      return "Dialogue";
    case NodeKind::RawCode:
      return "RawCode";
    case NodeKind::Hub:
      return "Hub";
    case NodeKind::Jump:
      return "Jump";
    case NodeKind::Condition:
      return "Condition";
    case NodeKind::Instruction:
      return "Instruction";
    case NodeKind::Comment:
      return "Comment";
    case NodeKind::Unsupported:
      return "Unsupported";
  }
  return "Unsupported";
}

void FlowGraph::add_node(Node node)
{
  const auto it = node_index_.find(node.id);
  if (it != node_index_.end()) {
    // Later definitions replace earlier ones; ids are unique in a valid export.
    nodes_[it->second] = std::move(node);
    return;
  }
  node_index_.emplace(node.id, nodes_.size());
  nodes_.push_back(std::move(node));
}

void FlowGraph::add_entity(Entity entity)
{
  entity_index_[entity.id] = entities_.size();
  entities_.push_back(std::move(entity));
}

void FlowGraph::add_variable(Variable variable) { variables_.push_back(std::move(variable)); }

void FlowGraph::add_namespace(VariableNamespace ns) { namespaces_.push_back(std::move(ns)); }

void FlowGraph::finalize()
{
  pin_index_.clear();
  for (auto & node : nodes_) {
    node.children.clear();
  }

  for (size_t i = 0; i < nodes_.size(); ++i) {
    const Node & node = nodes_[i];
    for (size_t p = 0; p < node.input_pins.size(); ++p) {
      pin_index_[node.input_pins[p].id] = PinRef{i, PinDirection::Input, p};
    }
    for (size_t p = 0; p < node.output_pins.size(); ++p) {
      pin_index_[node.output_pins[p].id] = PinRef{i, PinDirection::Output, p};
    }
  }

  // Children keep the insertion order of the nodes.
  for (const auto & node : nodes_) {
    if (node.parent.empty()) {
      continue;
    }
    const auto parent = node_index_.find(node.parent);
    if (parent != node_index_.end() && parent->second < nodes_.size()) {
      nodes_[parent->second].children.push_back(node.id);
    }
  }

  if (roots_.empty()) {
    for (const auto & node : nodes_) {
      if (node.parent.empty() || node_index_.count(node.parent) == 0) {
        roots_.push_back(node.id);
      }
    }
  }
}

const Node * FlowGraph::find_node(const std::string & id) const
{
  const auto it = node_index_.find(id);
  if (it == node_index_.end()) {
    return nullptr;
  }
  return &nodes_[it->second];
}

const Pin * FlowGraph::find_pin(const std::string & pin_id) const
{
  const auto it = pin_index_.find(pin_id);
  if (it == pin_index_.end()) {
    return nullptr;
  }
  const PinRef & ref = it->second;
  const Node & owner = nodes_[ref.node];
  if (ref.direction == PinDirection::Input) {
    return &owner.input_pins[ref.index];
  }
  return &owner.output_pins[ref.index];
}

const Entity * FlowGraph::find_entity(const std::string & id) const
{
  const auto it = entity_index_.find(id);
  if (it == entity_index_.end()) {
    return nullptr;
  }
  return &entities_[it->second];
}

size_t FlowGraph::connection_count() const noexcept
{
  size_t count = 0;
  for (const auto & node : nodes_) {
    for (const auto & pin : node.input_pins) {
      count += pin.connections.size();
    }
    for (const auto & pin : node.output_pins) {
      count += pin.connections.size();
    }
  }
  return count;
}

}  // namespace rpyflow
