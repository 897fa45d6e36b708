// rpyflow/project/project_config.cpp - Project configuration implementation
//
#include "rpyflow/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace rpyflow
{

namespace
{

namespace fs = std::filesystem;

std::string trim(const std::string & s)
{
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

/// Read an optional scalar into `out`; absent keys keep the default.
template <typename T>
void read_scalar(const YAML::Node & section, const char * key, T & out)
{
  if (section && section[key]) {
    out = section[key].as<T>();
  }
}

/// Read a list given either as a YAML sequence or as a comma separated string.
void read_list(const YAML::Node & section, const char * key, std::vector<std::string> & out)
{
  if (!section || !section[key]) {
    return;
  }
  const YAML::Node node = section[key];
  if (node.IsSequence()) {
    out.clear();
    for (const auto & item : node) {
      const std::string value = trim(item.as<std::string>());
      if (!value.empty()) {
        out.push_back(value);
      }
    }
    return;
  }
  if (node.IsNull()) {
    out.clear();
    return;
  }
  out = split_comma_list(node.as<std::string>());
}

fs::path resolve_path(const fs::path & root, const std::string & value)
{
  const fs::path p(value);
  if (p.is_absolute()) {
    return p.lexically_normal();
  }
  return (root / p).lexically_normal();
}

ConfigLoadResult parse_root(const YAML::Node & root, const fs::path & project_root)
{
  if (root && !root.IsNull() && !root.IsMap()) {
    return ConfigLoadResult::fail("settings file must contain a map of sections");
  }

  ProjectConfig config;
  config.project_root = project_root;

  // Parse 'paths' section
  const YAML::Node paths = root["paths"];
  std::string articy_json;
  std::string target_dir;
  std::string game_dir;
  read_scalar(paths, "path_articy_json", articy_json);
  read_scalar(paths, "path_target_dir", target_dir);
  read_scalar(paths, "path_game_dir", game_dir);
  if (articy_json.empty()) {
    return ConfigLoadResult::fail("paths.path_articy_json is required");
  }
  if (target_dir.empty()) {
    return ConfigLoadResult::fail("paths.path_target_dir is required");
  }
  config.paths.articy_json = resolve_path(project_root, articy_json);
  config.paths.target_dir = resolve_path(project_root, target_dir);
  if (!game_dir.empty()) {
    config.paths.game_dir = resolve_path(project_root, game_dir);
  }

  // Parse 'files' section
  const YAML::Node files = root["files"];
  read_scalar(files, "file_prefix", config.files.file_prefix);
  read_scalar(files, "base_file_name", config.files.base_file_name);
  read_scalar(files, "variables_file_name", config.files.variables_file_name);
  read_scalar(files, "characters_file_name", config.files.characters_file_name);
  read_scalar(files, "log_file_name", config.files.log_file_name);
  if (config.files.file_prefix.empty()) {
    // The output reconciler relies on a non-empty prefix.
    return ConfigLoadResult::fail("files.file_prefix must not be empty");
  }

  // Parse 'renpy' section
  const YAML::Node renpy = root["renpy"];
  read_scalar(renpy, "character_prefix", config.renpy.character_prefix);
  read_scalar(renpy, "label_prefix", config.renpy.label_prefix);
  read_scalar(renpy, "start_label", config.renpy.start_label);
  read_scalar(renpy, "start_node", config.renpy.start_node);
  read_scalar(renpy, "end_label", config.renpy.end_label);
  read_scalar(renpy, "menu_display_text_box", config.renpy.menu_display_text_box);
  read_scalar(renpy, "markdown_text_styles", config.renpy.markdown_text_styles);
  read_scalar(renpy, "relative_imgs_in_braces", config.renpy.relative_imgs_in_braces);
  read_list(renpy, "beginnings_log_lines", config.renpy.beginnings_log_lines);
  read_scalar(renpy, "repeat_menu_text", config.renpy.repeat_menu_text);
  if (config.renpy.start_label.empty() || config.renpy.end_label.empty()) {
    return ConfigLoadResult::fail("renpy.start_label and renpy.end_label must not be empty");
  }
  if (config.renpy.start_label == config.renpy.end_label) {
    return ConfigLoadResult::fail(
      "renpy.start_label and renpy.end_label must differ (both are '" +
      config.renpy.start_label + "')");
  }

  // Parse 'articy' section
  const YAML::Node articy = root["articy"];
  read_list(articy, "features_renpy_character_params", config.articy.features_renpy_character_params);
  read_scalar(articy, "renpy_character_name", config.articy.renpy_character_name);
  read_list(articy, "renpy_box", config.articy.renpy_box);

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::vector<std::string> split_comma_list(const std::string & text)
{
  std::vector<std::string> out;
  std::string::size_type start = 0;
  while (start <= text.size()) {
    auto comma = text.find(',', start);
    if (comma == std::string::npos) {
      comma = text.size();
    }
    const std::string item = trim(text.substr(start, comma - start));
    if (!item.empty()) {
      out.push_back(item);
    }
    start = comma + 1;
  }
  return out;
}

ConfigLoadResult parse_project_config(const std::string & yaml_text, const fs::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const fs::path & config_path)
{
  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail(
      "invalid value in " + config_path.string() + ": " + std::string(e.what()));
  }
}

std::optional<fs::path> find_project_config(const fs::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If startDir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace rpyflow
