// rpyflow/compiler/node_compiler.cpp - One graph node -> one labelled script block
//
#include "rpyflow/compiler/node_compiler.hpp"

#include <algorithm>

#include "rpyflow/basic/errors.hpp"

namespace rpyflow
{

namespace
{

std::string single_line(std::string text)
{
  text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());
  std::replace(text.begin(), text.end(), '\n', ' ');
  return text;
}

std::string input_guard(const Node & node)
{
  return node.input_pins.empty() ? std::string() : translate_expression(node.input_pins.front().text);
}

}  // namespace

void NodeCompiler::compile(const Node & node, script::FileUnit & unit)
{
  if (node.kind == NodeKind::Comment || node.kind == NodeKind::Unsupported) {
    return;
  }
  if (unit.closed) {
    throw CompileError(
      node.id, "node " + node.id + " reached after " + unit.relative_path() + " was completed");
  }
  session_.labels().define(node.id, session_.label_of(node));
  unit.blocks.push_back(build_block(node));
}

script::Block NodeCompiler::build_block(const Node & node)
{
  script::Block block;
  block.label = session_.label_of(node);
  block.node_id = node.id;

  block.add(1, "# " + node.type_name);
  if (!node.display_name.empty()) {
    block.add(1, "# " + single_line(node.display_name));
  }

  bool guarded = false;
  switch (node.kind) {
    case NodeKind::Dialogue:
      guarded = emit_content(node, dialogue_content(node), block);
      branches_.emit(node, BranchResolver::outgoing_pin(node), block, 1);
      break;

    case NodeKind::RawCode:
      guarded = emit_content(node, raw_code_content(node), block);
      branches_.emit(node, BranchResolver::outgoing_pin(node), block, 1);
      break;

    case NodeKind::Instruction: {
      std::vector<std::string> content;
      for (const auto & stmt : split_instructions(node.expression)) {
        content.push_back("$ " + stmt);
      }
      guarded = emit_content(node, std::move(content), block);
      branches_.emit(node, BranchResolver::outgoing_pin(node), block, 1);
      break;
    }

    case NodeKind::Hub:
      branches_.emit(node, BranchResolver::outgoing_pin(node), block, 1);
      break;

    case NodeKind::Jump:
      if (node.jump_target.empty()) {
        branches_.emit(node, nullptr, block, 1);
      } else {
        block.add_jump(1, node.jump_target);
      }
      break;

    case NodeKind::Condition:
      emit_condition(node, block);
      break;

    case NodeKind::Container:
      for (const auto & line : split_lines(node.text)) {
        if (!line.empty()) {
          block.add(1, "# " + line);
        }
      }
      branches_.emit(node, BranchResolver::outgoing_pin(node), block, 1);
      break;

    case NodeKind::Comment:
    case NodeKind::Unsupported:
      break;
  }

  if (!guarded) {
    const std::string guard = input_guard(node);
    if (!guard.empty()) {
      report_unguarded_condition(node, guard);
    }
  }
  return block;
}

// ============================================================================
// Content
// ============================================================================

bool NodeCompiler::emit_content(
  const Node & node, std::vector<std::string> content, script::Block & block)
{
  if (content.empty()) {
    return false;
  }
  const std::string guard = input_guard(node);
  int indent = 1;
  if (!guard.empty()) {
    block.add(1, "if " + guard + ":");
    indent = 2;
  }
  for (auto & line : content) {
    block.add(indent, std::move(line));
  }
  return true;
}

// Branching is never guarded: the flow continues whether or not the condition holds.
void NodeCompiler::report_unguarded_condition(const Node & node, const std::string & guard)
{
  session_.diags()
    .report_warning(
      session_.locate(node), "input pin condition \"" + guard +
                               "\" has no content to guard and only applies when the node is "
                               "offered as a menu choice")
    .with_code(diag_code::k_unguarded_condition)
    .with_help("move the condition onto a connected dialogue or instruction node");
}

std::vector<std::string> NodeCompiler::dialogue_content(const Node & node)
{
  return say_lines(node, node.text);
}

std::vector<std::string> NodeCompiler::raw_code_content(const Node & node)
{
  const DirectiveSet & directives = session_.directives_of(node);

  CodeContext ctx;
  ctx.container_path = session_.container_path_of(node);
  ctx.relative_imgs_in_braces = directives.flag(directive::k_relative_imgs_in_braces);

  std::vector<std::string> lines =
    session_.renderer().render_code_lines(node.text, ctx, session_.locate(node));

  if (directives.flag(directive::k_repeat_menu_text) && !node.menu_text.empty()) {
    for (auto & line : say_lines(node, node.menu_text)) {
      lines.push_back(std::move(line));
    }
  }
  return lines;
}

std::vector<std::string> NodeCompiler::say_lines(const Node & node, const std::string & text)
{
  const DirectiveSet & directives = session_.directives_of(node);
  const std::vector<std::string> paragraphs =
    session_.renderer().render_say_text(text, directives.flag(directive::k_markdown));
  if (paragraphs.empty()) {
    return {};
  }

  std::string prefix;
  if (const auto speaker = speaker_token(node)) {
    prefix = *speaker + " ";
  }
  const std::string before = directives.get_string(directive::k_before).value_or("");
  if (!before.empty()) {
    prefix += before + " ";
  }
  const std::string after = directives.get_string(directive::k_after).value_or("");

  std::vector<std::string> lines;
  lines.reserve(paragraphs.size());
  for (const auto & paragraph : paragraphs) {
    std::string line = prefix + "\"" + paragraph + "\"";
    if (!after.empty()) {
      line += " " + after;
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

std::optional<std::string> NodeCompiler::speaker_token(const Node & node)
{
  const auto explicit_speaker = session_.directives_of(node).get_string(directive::k_speaker);
  if (explicit_speaker && !explicit_speaker->empty()) {
    return "\"" + escape_text(*explicit_speaker) + "\"";
  }
  if (node.speaker.empty()) {
    return std::nullopt;
  }
  if (const std::string * name = session_.character_name(node.speaker)) {
    return *name;
  }
  session_.diags()
    .report_warning(session_.locate(node), "speaker " + node.speaker + " is not a known character")
    .with_code(diag_code::k_unknown_speaker);
  return std::nullopt;
}

// ============================================================================
// Condition
// ============================================================================

void NodeCompiler::emit_condition(const Node & node, script::Block & block)
{
  std::string expression = translate_expression(node.expression);
  if (expression.empty()) {
    expression = "True";
  }
  const Pin * when_true = !node.output_pins.empty() ? &node.output_pins[0] : nullptr;
  const Pin * when_false = node.output_pins.size() > 1 ? &node.output_pins[1] : nullptr;

  block.add(1, "if " + expression + ":");
  branches_.emit(node, when_true, block, 2);
  block.add(1, "else:");
  branches_.emit(node, when_false, block, 2);
}

}  // namespace rpyflow
