// rpyflow/compiler/compile_session.hpp - State shared by one compile run
//
#pragma once

#include <string>
#include <unordered_map>

#include "rpyflow/basic/diagnostic.hpp"
#include "rpyflow/compiler/asset_index.hpp"
#include "rpyflow/compiler/directives.hpp"
#include "rpyflow/compiler/text_renderer.hpp"
#include "rpyflow/model/flow_graph.hpp"
#include "rpyflow/project/project_config.hpp"

namespace rpyflow
{

/**
 * Where a container's script file goes.
 */
struct ContainerLayout
{
  /// Relative to the target dir, '/' separated
  std::string directory;
  std::string file_name;

  [[nodiscard]] std::string file_path() const { return directory + "/" + file_name; }
};

/**
 * Node id <-> label mapping. Labels are unique across the whole output.
 */
class LabelTable
{
public:
  /// Register the label of a node; throws CompileError if the label is taken.
  void define(const std::string & node_id, const std::string & label);

  /// Register a label that belongs to no node (start / end).
  void reserve(const std::string & label);

  [[nodiscard]] const std::string * find(const std::string & node_id) const;

  [[nodiscard]] bool contains_label(const std::string & label) const
  {
    return owners_.count(label) != 0;
  }

  [[nodiscard]] size_t size() const noexcept { return labels_.size(); }

private:
  std::unordered_map<std::string, std::string> labels_;  // node id -> label
  std::unordered_map<std::string, std::string> owners_;  // label -> node id
};

/**
 * Everything the compiler stages share: inputs, the diagnostics sink, the
 * label table, container layouts and character names.
 */
class CompileSession
{
public:
  CompileSession(
    const FlowGraph & graph, const ProjectConfig & config, DiagnosticBag & diags,
    const AssetIndex * assets = nullptr);

  CompileSession(const CompileSession &) = delete;
  CompileSession & operator=(const CompileSession &) = delete;

  [[nodiscard]] const FlowGraph & graph() const noexcept { return graph_; }
  [[nodiscard]] const ProjectConfig & config() const noexcept { return config_; }
  [[nodiscard]] const RenpyConfig & renpy() const noexcept { return config_.renpy; }
  [[nodiscard]] DiagnosticBag & diags() noexcept { return diags_; }
  [[nodiscard]] const TextRenderer & renderer() const noexcept { return renderer_; }
  [[nodiscard]] LabelTable & labels() noexcept { return labels_; }
  [[nodiscard]] const LabelTable & labels() const noexcept { return labels_; }

  /// Resolved stage directions of a node (parsed once, diagnostics reported once)
  const DirectiveSet & directives_of(const Node & node);

  /// `label` stage direction if present, else the default label
  [[nodiscard]] std::string label_of(const Node & node);

  [[nodiscard]] std::string default_label(const std::string & node_id) const
  {
    return config_.renpy.label_prefix + node_id;
  }

  /// File, node id and label of a node for diagnostics
  [[nodiscard]] DiagnosticLocation locate(const Node & node);

  // Container layout
  void set_layout(const std::string & container_id, ContainerLayout layout);
  [[nodiscard]] const ContainerLayout * layout_of(const std::string & container_id) const;

  /// Generated file a node's block ends up in
  [[nodiscard]] std::string file_of(const Node & node) const;

  /// Directory of the container a node lives in ("" at the top level)
  [[nodiscard]] std::string container_path_of(const Node & node) const;

  [[nodiscard]] std::string base_file() const
  {
    return config_.files.prefixed(config_.files.base_file_name);
  }

  // Characters
  void set_character_name(const std::string & entity_id, std::string name);
  [[nodiscard]] const std::string * character_name(const std::string & entity_id) const;

private:
  const FlowGraph & graph_;
  const ProjectConfig & config_;
  DiagnosticBag & diags_;
  DirectiveSchema schema_;
  TextRenderer renderer_;
  LabelTable labels_;

  std::unordered_map<std::string, DirectiveSet> directives_;
  std::unordered_map<std::string, ContainerLayout> layouts_;
  std::unordered_map<std::string, std::string> characters_;
};

}  // namespace rpyflow
