// rpyflow/driver/output_reconciler.hpp - Safe regeneration of the target directory
//
// The only component that deletes or writes files. Before anything is
// deleted, the existing directory content is compared with the footprint a
// previous run would have left; anything else aborts the run.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <gsl/span>
#include <string>
#include <vector>

#include "rpyflow/codegen/script_model.hpp"

namespace rpyflow
{

/// One immediate child of the target directory.
struct FootprintEntry
{
  std::string name;
  bool is_directory = false;
};

/// What a previous generation may have left in the target directory.
struct ExpectedFootprint
{
  /// Every file directly in the target dir starts with this prefix
  std::string file_prefix;

  /// Names of the immediate subdirectories
  std::vector<std::string> directories;
};

enum class ReconcileAction : uint8_t {
  Create,   ///< Target does not exist yet
  Replace,  ///< Target looks generated: clear it, then write
  Abort,    ///< Unexpected content: touch nothing
};

struct ReconcileDecision
{
  ReconcileAction action = ReconcileAction::Abort;

  /// Why the run was aborted (empty otherwise)
  std::string reason;

  [[nodiscard]] bool proceed() const noexcept { return action != ReconcileAction::Abort; }
};

/**
 * Decide how to treat the target directory. Pure function of its inputs.
 *
 * @param exists Whether the target path exists
 * @param is_directory Whether it is a directory
 * @param entries Its immediate children (ignored unless it is a directory)
 * @param expected Footprint of a previous generation
 */
[[nodiscard]] ReconcileDecision plan_reconcile(
  bool exists, bool is_directory, gsl::span<const FootprintEntry> entries,
  const ExpectedFootprint & expected);

class OutputReconciler
{
public:
  OutputReconciler(std::filesystem::path target_dir, ExpectedFootprint expected);

  /// Immediate children of the target directory (empty if it does not exist).
  [[nodiscard]] std::vector<FootprintEntry> scan() const;

  [[nodiscard]] ReconcileDecision check() const;

  /**
   * Clear the target directory (after check()) and write `files` below it.
   *
   * @return Absolute paths of the written files, in input order
   * @throws ReconcileError if the directory content is unexpected or a file
   *         path leaves the target directory
   */
  std::vector<std::filesystem::path> apply(gsl::span<const script::OutputFile> files) const;

  [[nodiscard]] const std::filesystem::path & target_dir() const noexcept { return target_dir_; }

private:
  /// check() that also hands back the scanned entries.
  [[nodiscard]] ReconcileDecision check(std::vector<FootprintEntry> & entries) const;

  [[nodiscard]] std::filesystem::path output_path(const std::string & relative_path) const;

  std::filesystem::path target_dir_;
  ExpectedFootprint expected_;
};

}  // namespace rpyflow
