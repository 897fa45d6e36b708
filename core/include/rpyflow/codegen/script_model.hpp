// rpyflow/codegen/script_model.hpp - Intermediate Ren'Py structure (graph -> model -> text)
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rpyflow::script
{

// NOTE:
// Jumps stay symbolic (target node id) until the whole tree has been
// compiled; the flow compiler then rewrites them to `jump <label>`.

struct Line
{
  int indent = 1;  // in units of 4 spaces, relative to column 0
  std::string text;

  /// Target node id of an unresolved jump
  std::optional<std::string> jump_node;
};

struct Block
{
  std::string label;
  std::string node_id;  // empty for the start / end blocks
  std::vector<Line> lines;

  /// Node ids this block may continue at
  std::vector<std::string> jump_targets;

  void add(int indent, std::string text) { lines.push_back(Line{indent, std::move(text), {}}); }

  void add_jump(int indent, const std::string & target)
  {
    lines.push_back(Line{indent, {}, target});
    jump_targets.push_back(target);
  }
};

struct FileUnit
{
  /// Container the file belongs to; empty for the base file
  std::string container_id;

  /// Directory relative to the target dir ('/' separated, empty for the root)
  std::string directory;
  std::string file_name;

  /// Comment lines written before the first block
  std::vector<std::string> header;

  std::vector<Block> blocks;

  /// Set once every child of the container has been compiled
  bool closed = false;

  [[nodiscard]] std::string relative_path() const
  {
    return directory.empty() ? file_name : directory + "/" + file_name;
  }
};

struct ScriptTree
{
  /// One unit per container, in traversal (pre-)order
  std::vector<FileUnit> units;

  /// Start and end labels plus top-level leaf nodes
  FileUnit base;

  std::string variables_source;
  std::string characters_source;

  /// Directory names directly below the target dir
  std::vector<std::string> top_level_directories;
};

struct OutputFile
{
  std::string relative_path;
  std::string content;
};

}  // namespace rpyflow::script
