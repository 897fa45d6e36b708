// rpyflow/compiler/branch_resolver.cpp - Jump and menu emission for outgoing connections
//
#include "rpyflow/compiler/branch_resolver.hpp"

#include <algorithm>
#include <numeric>
#include <unordered_set>

#include "rpyflow/basic/errors.hpp"

namespace rpyflow
{

std::optional<BranchTarget> BranchResolver::resolve_target(const Connection & connection) const
{
  std::unordered_set<std::string> visited;
  const Connection * current = &connection;
  while (true) {
    const Pin * pin = session_.graph().find_pin(current->target_pin);
    if (pin == nullptr) {
      // Unknown pin: trust the target node id (resolved or reported later).
      if (current->target_node.empty()) {
        return std::nullopt;
      }
      return BranchTarget{current->target_node, nullptr, connection.label};
    }
    if (pin->direction == PinDirection::Input) {
      return BranchTarget{pin->owner, pin, connection.label};
    }
    if (!visited.insert(pin->id).second || pin->connections.empty()) {
      return std::nullopt;
    }
    current = &pin->connections.front();
  }
}

const Pin * BranchResolver::outgoing_pin(const Node & node)
{
  if (node.is_container() && !node.input_pins.empty() &&
      !node.input_pins.front().connections.empty()) {
    return &node.input_pins.front();
  }
  if (!node.output_pins.empty()) {
    return &node.output_pins.front();
  }
  return nullptr;
}

void BranchResolver::emit(const Node & node, const Pin * pin, script::Block & block, int indent)
{
  std::vector<BranchTarget> targets;
  if (pin != nullptr) {
    // Input pins carry conditions, not instructions.
    if (pin->direction == PinDirection::Output) {
      for (const auto & stmt : split_instructions(pin->text)) {
        block.add(indent, "$ " + stmt);
      }
    }
    for (const auto & connection : pin->connections) {
      auto target = resolve_target(connection);
      if (target) {
        targets.push_back(std::move(*target));
      }
    }
  }

  targets = menu_order(std::move(targets));
  if (targets.empty()) {
    emit_dangling(node, block, indent);
    return;
  }
  if (targets.size() == 1) {
    block.add_jump(indent, targets.front().node_id);
    return;
  }
  emit_menu(node, targets, block, indent);
}

std::vector<BranchTarget> BranchResolver::menu_order(std::vector<BranchTarget> targets)
{
  std::vector<BranchTarget> unique;
  std::unordered_set<std::string> seen;
  for (auto & target : targets) {
    if (seen.insert(target.node_id).second) {
      unique.push_back(std::move(target));
    }
  }

  std::vector<std::optional<int64_t>> keys;
  keys.reserve(unique.size());
  for (const auto & target : unique) {
    const Node * node = session_.graph().find_node(target.node_id);
    keys.push_back(
      node != nullptr ? session_.directives_of(*node).get_int(directive::k_choice_index)
                      : std::nullopt);
  }

  std::vector<size_t> order(unique.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    if (keys[a].has_value() != keys[b].has_value()) {
      return keys[a].has_value();
    }
    return keys[a].has_value() && *keys[a] < *keys[b];
  });

  std::vector<BranchTarget> sorted;
  sorted.reserve(unique.size());
  for (const size_t i : order) {
    sorted.push_back(std::move(unique[i]));
  }
  return sorted;
}

void BranchResolver::emit_dangling(const Node & node, script::Block & block, int indent)
{
  const std::string & end_label = session_.renpy().end_label;
  session_.diags()
    .report_warning(
      session_.locate(node),
      "was not assigned any jump target in Articy, will jump to \"" + end_label + "\"")
    .with_code(diag_code::k_dangling_jump);
  block.add(indent, "jump " + end_label);
}

void BranchResolver::emit_menu(
  const Node & node, const std::vector<BranchTarget> & targets, script::Block & block, int indent)
{
  block.add(indent, "menu:");
  if (session_.directives_of(node).flag(directive::k_display_text_box)) {
    block.add(indent + 1, "extend \"\"");
  }
  for (const auto & target : targets) {
    const std::string text = choice_text(target);
    const std::string condition =
      target.input_pin != nullptr ? translate_expression(target.input_pin->text) : std::string();
    if (condition.empty()) {
      block.add(indent + 1, "\"" + text + "\":");
    } else {
      block.add(indent + 1, "\"" + text + "\" if " + condition + ":");
    }
    block.add_jump(indent + 2, target.node_id);
  }
}

std::string BranchResolver::choice_text(const BranchTarget & target)
{
  const Node * node = session_.graph().find_node(target.node_id);
  const bool markdown = node != nullptr ? session_.directives_of(*node).flag(directive::k_markdown)
                                        : session_.renpy().markdown_text_styles;
  const TextRenderer & renderer = session_.renderer();

  if (node != nullptr) {
    std::string text = renderer.render_choice_text(node->menu_text, markdown);
    if (!text.empty()) {
      return text;
    }
  }
  std::string text = renderer.render_choice_text(target.connection_label, markdown);
  if (!text.empty()) {
    return text;
  }
  if (node != nullptr) {
    text = renderer.render_choice_text(node->text, markdown);
    if (!text.empty()) {
      return text;
    }
  }
  throw CompileError(
    target.node_id, "menu choice leading to node " + target.node_id +
                      " has no text (no MenuText, connection label or Text)");
}

}  // namespace rpyflow
