// rpyflow/driver/output_reconciler.cpp - Safe regeneration of the target directory
//
#include "rpyflow/driver/output_reconciler.hpp"

#include <algorithm>
#include <fstream>

#include "rpyflow/basic/errors.hpp"

namespace fs = std::filesystem;

namespace rpyflow
{

ReconcileDecision plan_reconcile(
  bool exists, bool is_directory, gsl::span<const FootprintEntry> entries,
  const ExpectedFootprint & expected)
{
  if (!exists) {
    return ReconcileDecision{ReconcileAction::Create, {}};
  }
  if (!is_directory) {
    return ReconcileDecision{ReconcileAction::Abort, "target path exists and is not a directory"};
  }

  for (const auto & entry : entries) {
    if (entry.is_directory) {
      const auto & dirs = expected.directories;
      if (std::find(dirs.begin(), dirs.end(), entry.name) == dirs.end()) {
        return ReconcileDecision{
          ReconcileAction::Abort, "did not expect directory \"" + entry.name + "\""};
      }
      continue;
    }
    if (expected.file_prefix.empty() || entry.name.rfind(expected.file_prefix, 0) != 0) {
      return ReconcileDecision{
        ReconcileAction::Abort, "did not expect file \"" + entry.name + "\""};
    }
  }
  return ReconcileDecision{ReconcileAction::Replace, {}};
}

OutputReconciler::OutputReconciler(fs::path target_dir, ExpectedFootprint expected)
: target_dir_(std::move(target_dir)), expected_(std::move(expected))
{
}

std::vector<FootprintEntry> OutputReconciler::scan() const
{
  std::vector<FootprintEntry> entries;
  std::error_code ec;
  if (!fs::is_directory(target_dir_, ec)) {
    return entries;
  }
  for (const auto & item : fs::directory_iterator(target_dir_)) {
    // Symlinks count as files so they are never followed during deletion.
    entries.push_back(FootprintEntry{
      item.path().filename().string(), item.is_directory() && !item.is_symlink()});
  }
  std::sort(entries.begin(), entries.end(), [](const auto & a, const auto & b) {
    return a.name < b.name;
  });
  return entries;
}

ReconcileDecision OutputReconciler::check() const
{
  std::vector<FootprintEntry> entries;
  return check(entries);
}

ReconcileDecision OutputReconciler::check(std::vector<FootprintEntry> & entries) const
{
  std::error_code ec;
  const auto status = fs::status(target_dir_, ec);
  const bool exists = !ec && fs::exists(status);
  const bool is_directory = exists && fs::is_directory(status);
  entries = is_directory ? scan() : std::vector<FootprintEntry>{};
  return plan_reconcile(exists, is_directory, entries, expected_);
}

fs::path OutputReconciler::output_path(const std::string & relative_path) const
{
  const fs::path rel = fs::path(relative_path).lexically_normal();
  if (rel.empty() || rel.is_absolute() || rel.has_root_name() || *rel.begin() == "..") {
    throw ReconcileError(
      target_dir_, "generated file \"" + relative_path + "\" lies outside the target directory");
  }
  return target_dir_ / rel;
}

std::vector<fs::path> OutputReconciler::apply(gsl::span<const script::OutputFile> files) const
{
  std::vector<FootprintEntry> entries;
  const ReconcileDecision decision = check(entries);
  if (!decision.proceed()) {
    throw ReconcileError(
      target_dir_, "refusing to regenerate " + target_dir_.string() + ": " + decision.reason);
  }

  // Validate every destination before anything is deleted.
  std::vector<fs::path> paths;
  paths.reserve(files.size());
  for (const auto & file : files) {
    paths.push_back(output_path(file.relative_path));
  }

  // Only the entries that passed the footprint check are removed; the
  // directory is not iterated while it is being modified.
  if (decision.action == ReconcileAction::Replace) {
    for (const auto & entry : entries) {
      fs::remove_all(target_dir_ / entry.name);
    }
  }
  fs::create_directories(target_dir_);

  for (size_t i = 0; i < paths.size(); ++i) {
    fs::create_directories(paths[i].parent_path());
    std::ofstream out(paths[i], std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw ReconcileError(target_dir_, "cannot write " + paths[i].string());
    }
    out << files[i].content;
    if (!out) {
      throw ReconcileError(target_dir_, "failed writing " + paths[i].string());
    }
  }
  return paths;
}

}  // namespace rpyflow
