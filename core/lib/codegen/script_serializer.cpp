// rpyflow/codegen/script_serializer.cpp - Script model -> .rpy text
//
#include "rpyflow/codegen/script_serializer.hpp"

namespace rpyflow
{

void ScriptSerializer::append_line(std::string & out, int indent, const std::string & text)
{
  if (!text.empty()) {
    out.append(static_cast<size_t>(indent * k_indent_width), ' ');
    out += text;
  }
  out += '\n';
}

std::string ScriptSerializer::serialize_block(const script::Block & block)
{
  std::string out;
  append_line(out, 0, "label " + block.label + ":");
  for (const auto & line : block.lines) {
    append_line(out, line.indent, line.text);
  }
  return out;
}

std::string ScriptSerializer::serialize(const script::FileUnit & unit)
{
  std::string out;
  for (const auto & comment : unit.header) {
    append_line(out, 0, comment);
  }
  if (!unit.header.empty()) {
    out += '\n';
  }

  for (size_t i = 0; i < unit.blocks.size(); ++i) {
    if (i > 0) {
      out += '\n';
    }
    out += serialize_block(unit.blocks[i]);
  }
  return out;
}

std::vector<script::OutputFile> render_output_files(
  const script::ScriptTree & tree, const FilesConfig & files)
{
  std::vector<script::OutputFile> out;
  out.push_back({tree.base.relative_path(), ScriptSerializer::serialize(tree.base)});
  out.push_back({files.prefixed(files.variables_file_name), tree.variables_source});
  out.push_back({files.prefixed(files.characters_file_name), tree.characters_source});
  for (const auto & unit : tree.units) {
    out.push_back({unit.relative_path(), ScriptSerializer::serialize(unit)});
  }
  return out;
}

}  // namespace rpyflow
