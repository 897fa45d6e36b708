// rpyflow/model/flow_graph.hpp - In-memory flow graph (nodes, pins, entities, variables)
//
// Containers form an ownership tree (Node::parent / Node::children).
// Connections are a separate edge relation that references nodes and pins by id.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace rpyflow
{

// ============================================================================
// Nodes and Pins
// ============================================================================

enum class NodeKind : uint8_t {
  Container,    // FlowFragment / Dialogue: one directory + file
  Dialogue,     // DialogueFragment
  RawCode,      // template listed in renpy_box
  Hub,
  Jump,
  Condition,
  Instruction,
  Comment,      // ignored
  Unsupported,  // reported, not compiled
};

[[nodiscard]] std::string_view to_string(NodeKind kind);

enum class PinDirection : uint8_t {
  Input,
  Output,
};

struct Connection
{
  std::string label;
  std::string target_node;
  std::string target_pin;
};

/**
 * Input pins carry a condition, output pins an instruction.
 */
struct Pin
{
  std::string id;
  std::string owner;
  PinDirection direction = PinDirection::Input;
  std::string text;
  std::vector<Connection> connections;
};

struct Node
{
  std::string id;
  NodeKind kind = NodeKind::Unsupported;

  /// Type name from the export (e.g. "DialogueFragment", "RenPyBox")
  std::string type_name;

  /// Owning container id; empty for top-level nodes
  std::string parent;

  std::string display_name;
  std::string speaker;
  std::string text;
  std::string menu_text;

  /// Raw directive string (comma separated stage directions)
  std::string stage_directions;

  /// Condition / Instruction expression
  std::string expression;

  /// Jump nodes: target node id
  std::string jump_target;

  std::vector<Pin> input_pins;
  std::vector<Pin> output_pins;

  /// Direct children in declared order (containers only); filled by FlowGraph::finalize()
  std::vector<std::string> children;

  [[nodiscard]] bool is_container() const noexcept { return kind == NodeKind::Container; }
};

// ============================================================================
// Entities and Variables
// ============================================================================

using ParamValue = std::variant<std::string, bool, int64_t, double>;

struct EntityParam
{
  std::string name;
  ParamValue value;
};

struct Entity
{
  std::string id;
  std::string display_name;
  std::string type_name;

  /// Name the character gets in Ren'Py; empty derives it from display_name
  std::string script_name;

  /// Extra Character(...) keyword arguments
  std::vector<EntityParam> params;
};

struct Variable
{
  std::string name_space;
  std::string name;
  std::string type;  // "Boolean" | "Integer" | "String"
  std::string default_value;
  std::string description;
};

struct VariableNamespace
{
  std::string name;
  std::string description;
};

// ============================================================================
// FlowGraph
// ============================================================================

/**
 * Typed graph handed to the compiler.
 *
 * Populate with the add_* functions, then call finalize() once to build the
 * child lists, the pin index and (if none were set) the top-level order.
 */
class FlowGraph
{
public:
  FlowGraph() = default;

  void add_node(Node node);
  void add_entity(Entity entity);
  void add_variable(Variable variable);
  void add_namespace(VariableNamespace ns);

  /// Explicit top-level order (ids of nodes without a parent container)
  void set_roots(std::vector<std::string> roots) { roots_ = std::move(roots); }

  void finalize();

  // Lookup
  [[nodiscard]] const Node * find_node(const std::string & id) const;
  [[nodiscard]] const Pin * find_pin(const std::string & pin_id) const;
  [[nodiscard]] const Entity * find_entity(const std::string & id) const;

  // Accessors
  [[nodiscard]] const std::vector<Node> & nodes() const noexcept { return nodes_; }
  [[nodiscard]] const std::vector<std::string> & roots() const noexcept { return roots_; }
  [[nodiscard]] const std::vector<Entity> & entities() const noexcept { return entities_; }
  [[nodiscard]] const std::vector<Variable> & variables() const noexcept { return variables_; }
  [[nodiscard]] const std::vector<VariableNamespace> & namespaces() const noexcept
  {
    return namespaces_;
  }

  /// Number of connections over all output and input pins
  [[nodiscard]] size_t connection_count() const noexcept;

private:
  struct PinRef
  {
    size_t node = 0;
    PinDirection direction = PinDirection::Input;
    size_t index = 0;
  };

  std::vector<Node> nodes_;
  std::unordered_map<std::string, size_t> node_index_;
  std::unordered_map<std::string, PinRef> pin_index_;
  std::vector<std::string> roots_;

  std::vector<Entity> entities_;
  std::unordered_map<std::string, size_t> entity_index_;
  std::vector<Variable> variables_;
  std::vector<VariableNamespace> namespaces_;
};

}  // namespace rpyflow
