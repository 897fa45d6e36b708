// rpyflow/project/project_config.hpp - Project configuration (rpyflow.yaml)
//
// Parses and validates rpyflow.yaml settings files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rpyflow
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Input/output locations. Both required paths are resolved against the
 * directory containing the settings file.
 */
struct PathsConfig
{
  /// JSON export of the Articy project
  std::filesystem::path articy_json;

  /// Directory that will be generated and filled with the generated code
  std::filesystem::path target_dir;

  /// Ren'Py "game" directory used to check asset references.
  /// Defaults to the nearest ancestor of target_dir named "game".
  std::optional<std::filesystem::path> game_dir;
};

/**
 * Names of the generated files.
 */
struct FilesConfig
{
  /// Prefix for all files under target_dir
  std::string file_prefix = "articy_";

  std::string base_file_name = "start.rpy";
  std::string variables_file_name = "variables.rpy";
  std::string characters_file_name = "characters.rpy";
  std::string log_file_name = "log.txt";

  [[nodiscard]] std::string prefixed(const std::string & name) const { return file_prefix + name; }
};

/**
 * Settings for the generated Ren'Py code. Boolean settings are global
 * defaults that nodes may override with stage directions.
 */
struct RenpyConfig
{
  std::string character_prefix = "character.";
  std::string label_prefix = "label_";

  /// Label of the block at the start of the generated content
  std::string start_label = "start";

  /// Node the start label jumps to; empty selects the first top-level node
  std::string start_node;

  /// Label every block without a jump target falls back to
  std::string end_label = "end";

  bool menu_display_text_box = true;
  bool markdown_text_styles = false;
  bool relative_imgs_in_braces = false;

  /// Raw code lines starting with one of these (compared in lower case) are logged
  std::vector<std::string> beginnings_log_lines = {"# todo", "#todo"};

  bool repeat_menu_text = false;
};

/**
 * Names from the Articy project.
 */
struct ArticyConfig
{
  /// Template features holding parameters for Ren'Py Character objects
  std::vector<std::string> features_renpy_character_params = {"RenPyCharacterParams"};

  /// Property (inside those features) naming the character in Ren'Py
  std::string renpy_character_name = "RenPyCharacterName";

  /// Template types whose Text field is raw Ren'Py code
  std::vector<std::string> renpy_box = {"RenPyBox"};
};

/**
 * Complete project configuration (rpyflow.yaml).
 */
struct ProjectConfig
{
  PathsConfig paths;
  FilesConfig files;
  RenpyConfig renpy;
  ArticyConfig articy;

  /// Directory containing rpyflow.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a rpyflow.yaml file.
 *
 * @param config_path Path to rpyflow.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse a project configuration from YAML text.
 *
 * @param yaml_text Contents of a settings file
 * @param project_root Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to rpyflow.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Split a comma separated list, trimming entries and dropping empty ones.
 */
[[nodiscard]] std::vector<std::string> split_comma_list(const std::string & text);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "rpyflow.yaml";

}  // namespace rpyflow
