// rpyflow/compiler/node_compiler.hpp - One graph node -> one labelled script block
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rpyflow/codegen/script_model.hpp"
#include "rpyflow/compiler/branch_resolver.hpp"
#include "rpyflow/compiler/compile_session.hpp"

namespace rpyflow
{

/**
 * Converts one node into a CompiledBlock.
 *
 * Block layout:
 *   label <label>:
 *       # <TypeName>
 *       # <DisplayName>
 *       [if <input pin condition>:]
 *           <content>
 *       <output pin instructions>
 *       <jump or menu>
 */
class NodeCompiler
{
public:
  explicit NodeCompiler(CompileSession & session) : session_(session), branches_(session) {}

  /**
   * Compile `node` (any kind except Comment and Unsupported), append the block
   * to `unit` and register its label.
   *
   * @throws CompileError on a duplicate label or missing choice text
   */
  void compile(const Node & node, script::FileUnit & unit);

  /// Build the block without registering it anywhere.
  [[nodiscard]] script::Block build_block(const Node & node);

  /**
   * Say statements for `text`: one per paragraph, prefixed with the speaker
   * token and wrapped in the `before`/`after` stage directions.
   */
  [[nodiscard]] std::vector<std::string> say_lines(const Node & node, const std::string & text);

  /// Speaker token: `speaker` stage direction (quoted) or the entity's character name.
  [[nodiscard]] std::optional<std::string> speaker_token(const Node & node);

private:
  /// Returns false when there was nothing to emit (and nothing to guard).
  bool emit_content(const Node & node, std::vector<std::string> content, script::Block & block);

  void report_unguarded_condition(const Node & node, const std::string & guard);

  [[nodiscard]] std::vector<std::string> dialogue_content(const Node & node);
  [[nodiscard]] std::vector<std::string> raw_code_content(const Node & node);

  void emit_condition(const Node & node, script::Block & block);

  CompileSession & session_;
  BranchResolver branches_;
};

}  // namespace rpyflow
