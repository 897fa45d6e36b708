// rpyflow/compiler/branch_resolver.hpp - Jump and menu emission for outgoing connections
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rpyflow/codegen/script_model.hpp"
#include "rpyflow/compiler/compile_session.hpp"

namespace rpyflow
{

/**
 * Where one connection finally leads.
 */
struct BranchTarget
{
  /// Node owning the input pin the chain ends at
  std::string node_id;

  /// That input pin (nullptr if the export does not define it)
  const Pin * input_pin = nullptr;

  /// Label of the first connection of the chain
  std::string connection_label;
};

/**
 * Decides between a plain jump and a menu for a node's outgoing connections
 * and emits the corresponding lines.
 */
class BranchResolver
{
public:
  explicit BranchResolver(CompileSession & session) : session_(session) {}

  /**
   * Follow a connection to the node it leads to.
   *
   * Connections leaving a container point at the container's output pin; the
   * chain is followed through such pins until an input pin is reached.
   * Returns nullopt if the chain ends without one (or loops).
   */
  [[nodiscard]] std::optional<BranchTarget> resolve_target(const Connection & connection) const;

  /**
   * The pin whose connections continue the flow after `node`: for containers
   * with content the input pin (it leads inside), otherwise the first output pin.
   */
  [[nodiscard]] static const Pin * outgoing_pin(const Node & node);

  /**
   * Emit the continuation of `node` into `block`: output pin instructions,
   * then a jump (zero or one target) or a menu (several targets).
   *
   * @param pin Pin to follow (nullptr means no connections)
   * @param indent Indentation of the emitted statements
   */
  void emit(const Node & node, const Pin * pin, script::Block & block, int indent);

  /// Targets of a pin, deduplicated by node and ordered as they would appear in a menu.
  [[nodiscard]] std::vector<BranchTarget> menu_order(std::vector<BranchTarget> targets);

private:
  void emit_dangling(const Node & node, script::Block & block, int indent);

  void emit_menu(
    const Node & node, const std::vector<BranchTarget> & targets, script::Block & block, int indent);

  [[nodiscard]] std::string choice_text(const BranchTarget & target);

  CompileSession & session_;
};

}  // namespace rpyflow
