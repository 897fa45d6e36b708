// rpyflow/compiler/asset_index.cpp - Known asset files of the Ren'Py game
//
#include "rpyflow/compiler/asset_index.hpp"

namespace fs = std::filesystem;

namespace rpyflow
{

AssetIndex AssetIndex::scan(const fs::path & game_dir)
{
  AssetIndex index;
  std::error_code ec;
  if (!fs::is_directory(game_dir, ec)) {
    return index;
  }
  for (fs::recursive_directory_iterator it(game_dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) {
      continue;
    }
    const fs::path rel = fs::relative(it->path(), game_dir, entry_ec);
    if (!entry_ec) {
      index.add(rel.generic_string());
    }
  }
  return index;
}

void AssetIndex::add(std::string_view relative_path) { files_.insert(normalize(relative_path)); }

bool AssetIndex::contains(std::string_view relative_path) const
{
  return files_.count(normalize(relative_path)) != 0;
}

std::string AssetIndex::normalize(std::string_view relative_path)
{
  std::string p = fs::path(std::string(relative_path)).lexically_normal().generic_string();
  while (p.rfind("./", 0) == 0) {
    p.erase(0, 2);
  }
  return p;
}

}  // namespace rpyflow
