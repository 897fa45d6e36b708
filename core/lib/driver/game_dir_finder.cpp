// rpyflow/driver/game_dir_finder.cpp - Ren'Py "game" directory detection
//
#include "rpyflow/driver/game_dir_finder.hpp"

namespace fs = std::filesystem;

namespace rpyflow
{

std::optional<fs::path> find_game_dir(
  const fs::path & target_dir, const std::optional<fs::path> & configured)
{
  std::error_code ec;

  // 1. Explicit setting
  if (configured) {
    if (fs::is_directory(*configured, ec)) {
      return configured->lexically_normal();
    }
    return std::nullopt;
  }

  // 2. Nearest ancestor named "game" (the target itself does not count)
  const fs::path absolute = fs::absolute(target_dir, ec).lexically_normal();
  if (ec) {
    return std::nullopt;
  }
  fs::path current = absolute.filename().empty() ? absolute.parent_path() : absolute;
  while (current.has_parent_path() && current.parent_path() != current) {
    current = current.parent_path();
    if (current.filename() == "game") {
      return current;
    }
  }

  return std::nullopt;
}

}  // namespace rpyflow
