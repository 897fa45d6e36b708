// rpyflow/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline.
// Used by the CLI and the integration tests.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "rpyflow/basic/diagnostic.hpp"
#include "rpyflow/codegen/script_model.hpp"
#include "rpyflow/model/flow_graph.hpp"
#include "rpyflow/project/project_config.hpp"

namespace rpyflow
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Compile only; the target directory is not touched
  Build,  ///< Compile and regenerate the target directory
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  /// Compile mode
  CompileMode mode = CompileMode::Build;

  /// Target directory (overrides paths.path_target_dir)
  std::optional<std::filesystem::path> target_dir;

  /// Print progress to stderr
  bool verbose = false;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, notes)
  DiagnosticBag diagnostics;

  /// Written files (only populated for Build mode)
  std::vector<std::filesystem::path> generated_files;

  /// Every output file with its content, log included (both modes)
  std::vector<script::OutputFile> rendered_files;

  /// Content of the log file
  std::string log_text;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the full compilation pipeline.
 *
 * The pipeline consists of:
 * 1. Loading the Articy export (compile_project only)
 * 2. Indexing the game's asset files
 * 3. Compiling the flow graph into a script tree
 * 4. Rendering the files and the log
 * 5. Reconciling the target directory (Build mode only)
 *
 * Fatal errors abort the run before step 5 and leave the target untouched.
 */
class Compiler
{
public:
  /**
   * Compile a project defined by a ProjectConfig.
   *
   * @param config Project configuration (from rpyflow.yaml)
   * @param options Compile options (may override config settings)
   * @return CompileResult with success status and diagnostics
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

  /**
   * Compile an already loaded graph.
   *
   * @param graph Finalized flow graph
   * @param config Project configuration
   * @param options Compile options
   */
  [[nodiscard]] static CompileResult compile_graph(
    const FlowGraph & graph, const ProjectConfig & config, const CompileOptions & options);

private:
  static void run_pipeline(
    const FlowGraph & graph, const ProjectConfig & config, const CompileOptions & options,
    CompileResult & result);
};

}  // namespace rpyflow
