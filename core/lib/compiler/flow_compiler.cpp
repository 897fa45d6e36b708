// rpyflow/compiler/flow_compiler.cpp - Whole graph -> ScriptTree
//
#include "rpyflow/compiler/flow_compiler.hpp"

#include <fmt/format.h>

#include <cctype>
#include <limits>
#include <unordered_map>

#include "rpyflow/basic/errors.hpp"
#include "rpyflow/compiler/definitions.hpp"

namespace rpyflow
{

namespace
{

constexpr size_t k_base_unit = std::numeric_limits<size_t>::max();

/// Record `name` for a sibling; throws if another sibling already maps to it.
void claim_directory(
  std::unordered_map<std::string, std::string> & used, const std::string & name,
  const Node & container, const std::string & parent_directory)
{
  const auto [it, inserted] = used.emplace(name, container.id);
  if (!inserted) {
    const std::string where = parent_directory.empty() ? "the target directory" : parent_directory;
    throw CompileError(
      container.id, fmt::format(
                      "containers {} and {} both map to directory \"{}\" in {}", it->second,
                      container.id, name, where));
  }
}

}  // namespace

std::string container_directory_name(const Node & container)
{
  std::string name;
  name.reserve(container.display_name.size());
  for (const char c : container.display_name) {
    if (c == ' ' || c == '/' || c == '\\' || c == '\t' || c == '\r' || c == '\n') {
      name += '_';
    } else {
      name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }
  if (name.empty() || name == "." || name == "..") {
    return container.id;
  }
  return name;
}

script::ScriptTree FlowCompiler::compile()
{
  tree_ = script::ScriptTree{};
  visited_.clear();

  const FlowGraph & graph = session_.graph();
  const RenpyConfig & renpy = session_.renpy();

  DefinitionsWriter definitions(session_);
  tree_.characters_source = definitions.write_characters();
  tree_.variables_source = definitions.write_variables();

  plan_layout();

  session_.labels().reserve(renpy.start_label);
  session_.labels().reserve(renpy.end_label);

  script::FileUnit & base = tree_.base;
  base.file_name = session_.base_file();
  base.header = {"# Entry point of the game", "# Generated by rpyflow, changes will be overwritten"};

  script::Block start;
  start.label = renpy.start_label;
  const std::string start_node = select_start_node();
  if (start_node.empty()) {
    start.add(1, "jump " + renpy.end_label);
  } else {
    start.add_jump(1, start_node);
  }
  base.blocks.push_back(std::move(start));

  for (const auto & root_id : graph.roots()) {
    const Node * node = graph.find_node(root_id);
    if (node == nullptr) {
      continue;
    }
    if (node->is_container()) {
      visit_container(*node);
    } else {
      compile_child(*node, k_base_unit);
    }
  }

  script::Block end;
  end.label = renpy.end_label;
  end.add(1, "return");
  base.blocks.push_back(std::move(end));
  base.closed = true;

  resolve_jumps(tree_.base);
  for (auto & unit : tree_.units) {
    resolve_jumps(unit);
  }
  return std::move(tree_);
}

// ============================================================================
// Layout
// ============================================================================

void FlowCompiler::plan_layout()
{
  const FlowGraph & graph = session_.graph();
  const FilesConfig & files = session_.config().files;

  std::unordered_map<std::string, std::string> used;
  for (const auto & root_id : graph.roots()) {
    const Node * node = graph.find_node(root_id);
    if (node == nullptr || !node->is_container() || session_.layout_of(node->id) != nullptr) {
      continue;
    }
    const std::string name = container_directory_name(*node);
    claim_directory(used, name, *node, "");
    session_.set_layout(node->id, ContainerLayout{name, files.prefixed(name + ".rpy")});
    tree_.top_level_directories.push_back(name);
    plan_children(*node, name);
  }
}

void FlowCompiler::plan_children(const Node & container, const std::string & directory)
{
  const FlowGraph & graph = session_.graph();
  const FilesConfig & files = session_.config().files;

  std::unordered_map<std::string, std::string> used;
  for (const auto & child_id : container.children) {
    const Node * child = graph.find_node(child_id);
    if (child == nullptr || !child->is_container() || session_.layout_of(child->id) != nullptr) {
      continue;
    }
    const std::string name = container_directory_name(*child);
    claim_directory(used, name, *child, directory);
    const std::string child_dir = directory + "/" + name;
    session_.set_layout(child->id, ContainerLayout{child_dir, files.prefixed(name + ".rpy")});
    plan_children(*child, child_dir);
  }
}

std::string FlowCompiler::select_start_node() const
{
  const FlowGraph & graph = session_.graph();
  const std::string & configured = session_.renpy().start_node;
  if (!configured.empty()) {
    if (graph.find_node(configured) == nullptr) {
      throw CompileError(configured, "configured start node " + configured + " does not exist");
    }
    return configured;
  }
  if (graph.roots().empty()) {
    return {};
  }
  return graph.roots().front();
}

// ============================================================================
// Traversal
// ============================================================================

void FlowCompiler::visit_container(const Node & container)
{
  if (!visited_.insert(container.id).second) {
    return;
  }
  const ContainerLayout * layout = session_.layout_of(container.id);
  if (layout == nullptr) {
    throw CompileError(container.id, "container " + container.id + " has no output directory");
  }

  // Units are addressed by index: nested visits append to tree_.units.
  const size_t index = tree_.units.size();
  script::FileUnit unit;
  unit.container_id = container.id;
  unit.directory = layout->directory;
  unit.file_name = layout->file_name;
  tree_.units.push_back(std::move(unit));

  nodes_.compile(container, tree_.units[index]);

  const FlowGraph & graph = session_.graph();
  for (const auto & child_id : container.children) {
    const Node * child = graph.find_node(child_id);
    if (child == nullptr) {
      continue;
    }
    if (child->is_container()) {
      visit_container(*child);
    } else {
      compile_child(*child, index);
    }
  }
  tree_.units[index].closed = true;
}

void FlowCompiler::compile_child(const Node & node, size_t unit_index)
{
  if (!visited_.insert(node.id).second) {
    return;
  }
  script::FileUnit & unit = unit_index == k_base_unit ? tree_.base : tree_.units[unit_index];

  switch (node.kind) {
    case NodeKind::Comment:
      return;
    case NodeKind::Unsupported:
      session_.diags()
        .report_warning(
          DiagnosticLocation{unit.relative_path(), node.id, ""},
          "type \"" + node.type_name + "\" of node " + node.id + " is not supported")
        .with_code(diag_code::k_unsupported_node);
      return;
    default:
      nodes_.compile(node, unit);
      return;
  }
}

// ============================================================================
// Jump resolution
// ============================================================================

void FlowCompiler::resolve_jumps(script::FileUnit & unit)
{
  const std::string & end_label = session_.renpy().end_label;
  for (auto & block : unit.blocks) {
    for (auto & line : block.lines) {
      if (!line.jump_node) {
        continue;
      }
      if (const std::string * label = session_.labels().find(*line.jump_node)) {
        line.text = "jump " + *label;
        continue;
      }
      line.text = "jump " + end_label;
      session_.diags()
        .report_warning(
          DiagnosticLocation{unit.relative_path(), block.node_id, block.label},
          "jumps to unknown node " + *line.jump_node + ", will jump to \"" + end_label + "\"")
        .with_code(diag_code::k_unresolved_jump);
    }
  }
}

}  // namespace rpyflow
