// rpyflow/driver/game_dir_finder.hpp - Ren'Py "game" directory detection
//
// Asset references in generated code are relative to the game directory.
//
#pragma once

#include <filesystem>
#include <optional>

namespace rpyflow
{

/**
 * Find the Ren'Py game directory for a target directory.
 *
 * Search order:
 * 1. `configured` (paths.path_game_dir), if set and a directory
 * 2. The nearest ancestor of `target_dir` named "game"
 *
 * @return Path to the game directory, or nullopt if none was found
 */
[[nodiscard]] std::optional<std::filesystem::path> find_game_dir(
  const std::filesystem::path & target_dir,
  const std::optional<std::filesystem::path> & configured = std::nullopt);

}  // namespace rpyflow
