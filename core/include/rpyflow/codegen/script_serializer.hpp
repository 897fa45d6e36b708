// rpyflow/codegen/script_serializer.hpp - Script model -> .rpy text
#pragma once

#include <string>
#include <vector>

#include "rpyflow/codegen/script_model.hpp"
#include "rpyflow/project/project_config.hpp"

namespace rpyflow
{

/**
 * Serialize the script model to Ren'Py source text.
 *
 * Output looks like:
 *   label label_0x01:
 *       # DialogueFragment
 *       character.anna "Hello!"
 *       jump label_0x02
 *
 * Blocks are separated by one blank line; files end with a newline.
 */
class ScriptSerializer
{
public:
  static constexpr int k_indent_width = 4;

  [[nodiscard]] static std::string serialize(const script::FileUnit & unit);

  [[nodiscard]] static std::string serialize_block(const script::Block & block);

private:
  static void append_line(std::string & out, int indent, const std::string & text);
};

/**
 * Every generated file of a compiled tree except the log, in a stable order:
 * base, variables and characters file first, then the container files.
 */
[[nodiscard]] std::vector<script::OutputFile> render_output_files(
  const script::ScriptTree & tree, const FilesConfig & files);

}  // namespace rpyflow
