// rpyflow/model/articy_loader.hpp - Articy JSON export -> FlowGraph
//
// Reads the parts of the export the compiler needs:
//   Packages[0].Models   nodes, pins, connections, entities
//   Hierarchy            top-level order of the Flow
//   GlobalVariables      variable namespaces
//   ObjectDefinitions    template type -> base class
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

#include "rpyflow/basic/diagnostic.hpp"
#include "rpyflow/model/flow_graph.hpp"
#include "rpyflow/project/project_config.hpp"

namespace rpyflow
{

/**
 * Result of loading an export.
 */
struct GraphLoadResult
{
  /// Loaded graph (only valid if success == true), already finalized
  FlowGraph graph;

  bool success = false;

  std::string error;

  static GraphLoadResult ok(FlowGraph g)
  {
    GraphLoadResult r;
    r.graph = std::move(g);
    r.success = true;
    return r;
  }

  static GraphLoadResult fail(std::string msg)
  {
    GraphLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

class ArticyLoader
{
public:
  /**
   * @param config Template and feature names used by the project
   * @param diags DiagnosticBag for recoverable problems (may be nullptr)
   */
  explicit ArticyLoader(const ArticyConfig & config, DiagnosticBag * diags = nullptr)
  : config_(config), diags_(diags)
  {
  }

  [[nodiscard]] GraphLoadResult load_file(const std::filesystem::path & path) const;

  [[nodiscard]] GraphLoadResult load_string(const std::string & json_text) const;

  [[nodiscard]] GraphLoadResult load(const nlohmann::json & doc) const;

private:
  using ClassMap = std::unordered_map<std::string, std::string>;

  [[nodiscard]] static ClassMap read_object_definitions(const nlohmann::json & doc);

  /// Base class of a model type: its ObjectDefinitions class, or the type itself
  [[nodiscard]] static std::string base_class(const std::string & type, const ClassMap & classes);

  [[nodiscard]] NodeKind classify(const nlohmann::json & model, const std::string & base) const;

  [[nodiscard]] static Node read_node(const nlohmann::json & model, NodeKind kind);

  [[nodiscard]] static Pin read_pin(
    const nlohmann::json & pin, const std::string & owner, PinDirection direction);

  [[nodiscard]] Entity read_entity(const nlohmann::json & model) const;

  static void read_variables(const nlohmann::json & doc, FlowGraph & graph);

  [[nodiscard]] static std::vector<std::string> read_flow_roots(
    const nlohmann::json & doc, const FlowGraph & graph);

  const ArticyConfig & config_;
  DiagnosticBag * diags_ = nullptr;
};

}  // namespace rpyflow
