// rpyflow/compiler/asset_index.hpp - Known asset files of the Ren'Py game
//
#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace rpyflow
{

/**
 * Set of files below the Ren'Py "game" directory, stored relative to it with
 * '/' separators (e.g. "images/chapter_1/bg.png").
 */
class AssetIndex
{
public:
  AssetIndex() = default;

  /// Index every regular file below `game_dir` (empty index if it does not exist).
  [[nodiscard]] static AssetIndex scan(const std::filesystem::path & game_dir);

  void add(std::string_view relative_path);

  [[nodiscard]] bool contains(std::string_view relative_path) const;

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  [[nodiscard]] static std::string normalize(std::string_view relative_path);

  std::set<std::string, std::less<>> files_;
};

}  // namespace rpyflow
