// rpyflow/basic/errors.hpp - Fatal error types
//
// Recoverable problems go to a DiagnosticBag. The exceptions below abort the
// whole run; the driver catches them once and turns them into error
// diagnostics.
//
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace rpyflow
{

/**
 * Structural error in the flow graph that cannot be defaulted
 * (missing choice text, duplicate label, clashing directories, ...).
 */
class CompileError : public std::runtime_error
{
public:
  CompileError(std::string node_id, const std::string & message)
  : std::runtime_error(message), node_id_(std::move(node_id))
  {
  }

  /// Identifier of the offending node (may be empty for global problems)
  [[nodiscard]] const std::string & node_id() const noexcept { return node_id_; }

private:
  std::string node_id_;
};

/**
 * The target directory does not look like a previous generation and must not
 * be touched.
 */
class ReconcileError : public std::runtime_error
{
public:
  ReconcileError(std::filesystem::path directory, const std::string & message)
  : std::runtime_error(message), directory_(std::move(directory))
  {
  }

  [[nodiscard]] const std::filesystem::path & directory() const noexcept { return directory_; }

private:
  std::filesystem::path directory_;
};

}  // namespace rpyflow
