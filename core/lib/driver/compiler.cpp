// rpyflow/driver/compiler.cpp - Compiler driver implementation
//
#include "rpyflow/driver/compiler.hpp"

#include <fmt/core.h>

#include "rpyflow/basic/errors.hpp"
#include "rpyflow/codegen/script_serializer.hpp"
#include "rpyflow/compiler/asset_index.hpp"
#include "rpyflow/compiler/compile_session.hpp"
#include "rpyflow/compiler/flow_compiler.hpp"
#include "rpyflow/driver/game_dir_finder.hpp"
#include "rpyflow/driver/log_report.hpp"
#include "rpyflow/driver/output_reconciler.hpp"
#include "rpyflow/model/articy_loader.hpp"

namespace rpyflow
{

namespace fs = std::filesystem;

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  CompileResult result;

  if (options.verbose) {
    fmt::print(stderr, "Loading: {}\n", config.paths.articy_json.string());
  }

  const ArticyLoader loader(config.articy, &result.diagnostics);
  GraphLoadResult loaded = loader.load_file(config.paths.articy_json);
  if (!loaded.success) {
    result.diagnostics.report_error({}, loaded.error)
      .with_code(diag_code::k_load_failed)
      .with_help("check paths.path_articy_json and re-export the project from Articy");
    return result;
  }

  if (options.verbose) {
    fmt::print(
      stderr, "Loaded {} nodes, {} connections, {} entities, {} variables\n",
      loaded.graph.nodes().size(), loaded.graph.connection_count(),
      loaded.graph.entities().size(), loaded.graph.variables().size());
  }

  run_pipeline(loaded.graph, config, options, result);
  return result;
}

CompileResult Compiler::compile_graph(
  const FlowGraph & graph, const ProjectConfig & config, const CompileOptions & options)
{
  CompileResult result;
  run_pipeline(graph, config, options, result);
  return result;
}

void Compiler::run_pipeline(
  const FlowGraph & graph, const ProjectConfig & config, const CompileOptions & options,
  CompileResult & result)
{
  const fs::path target = options.target_dir.value_or(config.paths.target_dir);
  DiagnosticBag & diags = result.diagnostics;

  // Asset index
  std::optional<AssetIndex> assets;
  if (const auto game_dir = find_game_dir(target, config.paths.game_dir)) {
    assets = AssetIndex::scan(*game_dir);
    if (options.verbose) {
      fmt::print(stderr, "Indexed {} files in {}\n", assets->size(), game_dir->string());
    }
  } else {
    diags
      .report_note(
        {}, "no Ren'Py game directory found for " + target.string() +
              ", asset references are not checked")
      .with_code(diag_code::k_no_game_dir)
      .with_help("place the target directory inside the game directory or set paths.path_game_dir");
  }

  try {
    CompileSession session(graph, config, diags, assets ? &*assets : nullptr);
    FlowCompiler flow(session);
    const script::ScriptTree tree = flow.compile();

    if (options.verbose) {
      fmt::print(
        stderr, "Compiled {} labels into {} container files\n", session.labels().size(),
        tree.units.size());
    }

    result.rendered_files = render_output_files(tree, config.files);

    LogReport log;
    log.add_all(diags);
    result.log_text = log.render();
    result.rendered_files.push_back(
      {config.files.prefixed(config.files.log_file_name), result.log_text});

    if (options.mode == CompileMode::Build) {
      const OutputReconciler reconciler(
        target, ExpectedFootprint{config.files.file_prefix, tree.top_level_directories});
      result.generated_files = reconciler.apply(result.rendered_files);
    }
  } catch (const CompileError & e) {
    diags.report_error(DiagnosticLocation{"", e.node_id(), ""}, e.what())
      .with_code(diag_code::k_compile_failed);
  } catch (const ReconcileError & e) {
    diags.report_error({}, e.what())
      .with_code(diag_code::k_unsafe_target_dir)
      .with_help(
        "move unexpected content out of " + e.directory().string() +
        " or point paths.path_target_dir elsewhere");
  } catch (const fs::filesystem_error & e) {
    diags.report_error({}, e.what()).with_code(diag_code::k_unsafe_target_dir);
  }

  result.success = !diags.has_errors();
}

}  // namespace rpyflow
