// rpyflow/compiler/compile_session.cpp - State shared by one compile run
//
#include "rpyflow/compiler/compile_session.hpp"

#include "rpyflow/basic/errors.hpp"

namespace rpyflow
{

// ============================================================================
// LabelTable
// ============================================================================

void LabelTable::define(const std::string & node_id, const std::string & label)
{
  const auto owner = owners_.find(label);
  if (owner != owners_.end()) {
    const std::string previous = owner->second.empty() ? "a reserved label" : owner->second;
    throw CompileError(
      node_id, "label \"" + label + "\" of node " + node_id + " is already used by " + previous);
  }
  owners_.emplace(label, node_id);
  labels_[node_id] = label;
}

void LabelTable::reserve(const std::string & label)
{
  if (!owners_.emplace(label, std::string()).second) {
    throw CompileError("", "label \"" + label + "\" is reserved twice");
  }
}

const std::string * LabelTable::find(const std::string & node_id) const
{
  const auto it = labels_.find(node_id);
  if (it == labels_.end()) {
    return nullptr;
  }
  return &it->second;
}

// ============================================================================
// CompileSession
// ============================================================================

CompileSession::CompileSession(
  const FlowGraph & graph, const ProjectConfig & config, DiagnosticBag & diags,
  const AssetIndex * assets)
: graph_(graph),
  config_(config),
  diags_(diags),
  schema_(DirectiveSchema::standard(config.renpy)),
  renderer_(assets, config.renpy.beginnings_log_lines, diags)
{
}

const DirectiveSet & CompileSession::directives_of(const Node & node)
{
  const auto it = directives_.find(node.id);
  if (it != directives_.end()) {
    return it->second;
  }

  // The label is only known after parsing; patch it into the findings.
  DiagnosticBag local;
  DirectiveSet set = parse_directives(
    node.stage_directions, schema_, local, DiagnosticLocation{file_of(node), node.id, ""});
  const std::string label = set.get_string(directive::k_label).value_or(default_label(node.id));
  for (Diagnostic diag : local) {
    diag.location.label = label;
    diags_.add(std::move(diag));
  }
  return directives_.emplace(node.id, std::move(set)).first->second;
}

std::string CompileSession::label_of(const Node & node)
{
  return directives_of(node).get_string(directive::k_label).value_or(default_label(node.id));
}

DiagnosticLocation CompileSession::locate(const Node & node)
{
  return DiagnosticLocation{file_of(node), node.id, label_of(node)};
}

void CompileSession::set_layout(const std::string & container_id, ContainerLayout layout)
{
  layouts_[container_id] = std::move(layout);
}

const ContainerLayout * CompileSession::layout_of(const std::string & container_id) const
{
  const auto it = layouts_.find(container_id);
  if (it == layouts_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::string CompileSession::file_of(const Node & node) const
{
  // A container's own block opens its file.
  if (node.is_container()) {
    if (const auto * layout = layout_of(node.id)) {
      return layout->file_path();
    }
  }
  if (!node.parent.empty()) {
    if (const auto * layout = layout_of(node.parent)) {
      return layout->file_path();
    }
  }
  return base_file();
}

std::string CompileSession::container_path_of(const Node & node) const
{
  if (!node.parent.empty()) {
    if (const auto * layout = layout_of(node.parent)) {
      return layout->directory;
    }
  }
  return {};
}

void CompileSession::set_character_name(const std::string & entity_id, std::string name)
{
  characters_[entity_id] = std::move(name);
}

const std::string * CompileSession::character_name(const std::string & entity_id) const
{
  const auto it = characters_.find(entity_id);
  if (it == characters_.end()) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace rpyflow
