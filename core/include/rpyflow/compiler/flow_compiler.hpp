// rpyflow/compiler/flow_compiler.hpp - Whole graph -> ScriptTree
//
// Traversal:
//   1. Definitions (characters register their names first)
//   2. Layout: one directory + file per container, mirroring the container tree
//   3. Visit containers in pre-order; each child is compiled exactly once
//   4. Resolve symbolic jumps against the label table
//
#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "rpyflow/codegen/script_model.hpp"
#include "rpyflow/compiler/compile_session.hpp"
#include "rpyflow/compiler/node_compiler.hpp"

namespace rpyflow
{

/// Directory name of a container: lower case, spaces and path separators as '_'.
[[nodiscard]] std::string container_directory_name(const Node & container);

class FlowCompiler
{
public:
  explicit FlowCompiler(CompileSession & session) : session_(session), nodes_(session) {}

  /**
   * Compile the whole graph.
   *
   * @throws CompileError on structural problems (duplicate labels, clashing
   *         directories, missing choice text, bad variables, unknown start node)
   */
  [[nodiscard]] script::ScriptTree compile();

private:
  void plan_layout();
  void plan_children(const Node & container, const std::string & directory);

  [[nodiscard]] std::string select_start_node() const;

  void visit_container(const Node & container);
  void compile_child(const Node & node, size_t unit_index);

  void resolve_jumps(script::FileUnit & unit);

  CompileSession & session_;
  NodeCompiler nodes_;
  script::ScriptTree tree_;
  std::unordered_set<std::string> visited_;
};

}  // namespace rpyflow
