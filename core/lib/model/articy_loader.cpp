// rpyflow/model/articy_loader.cpp - Articy JSON export loader
//
#include "rpyflow/model/articy_loader.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace rpyflow
{

using nlohmann::json;

namespace
{

const json & empty_object()
{
  static const json k_empty = json::object();
  return k_empty;
}

const json & field(const json & obj, const char * key)
{
  if (!obj.is_object()) {
    return empty_object();
  }
  const auto it = obj.find(key);
  if (it == obj.end()) {
    return empty_object();
  }
  return *it;
}

/// String member or "" when absent / not a string.
std::string string_field(const json & obj, const char * key)
{
  const json & value = field(obj, key);
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return {};
}

/// Articy writes literal values as strings; older exports use JSON scalars.
std::string literal_field(const json & obj, const char * key)
{
  const json & value = field(obj, key);
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_boolean()) {
    return value.get<bool>() ? "True" : "False";
  }
  if (value.is_number()) {
    return value.dump();
  }
  return {};
}

/// Articy uses "0x0" (or an empty string) for an unset reference.
std::string reference_field(const json & obj, const char * key)
{
  std::string id = string_field(obj, key);
  if (id == "0x0" || id == "0x0000000000000000") {
    return {};
  }
  return id;
}

bool has_pins(const json & props)
{
  return field(props, "InputPins").is_array() || field(props, "OutputPins").is_array();
}

bool contains(const std::vector<std::string> & list, const std::string & value)
{
  return std::find(list.begin(), list.end(), value) != list.end();
}

}  // namespace

// ============================================================================
// Entry points
// ============================================================================

GraphLoadResult ArticyLoader::load_file(const std::filesystem::path & path) const
{
  std::ifstream in(path);
  if (!in.is_open()) {
    return GraphLoadResult::fail("cannot open export file: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  GraphLoadResult result = load_string(buffer.str());
  if (!result.success) {
    result.error = path.string() + ": " + result.error;
  }
  return result;
}

GraphLoadResult ArticyLoader::load_string(const std::string & json_text) const
{
  json doc;
  try {
    doc = json::parse(json_text);
  } catch (const json::parse_error & e) {
    return GraphLoadResult::fail("malformed JSON: " + std::string(e.what()));
  }
  return load(doc);
}

GraphLoadResult ArticyLoader::load(const json & doc) const
{
  const json & packages = field(doc, "Packages");
  if (!packages.is_array() || packages.empty()) {
    return GraphLoadResult::fail("export has no Packages section");
  }
  const json & models = field(packages.front(), "Models");
  if (!models.is_array()) {
    return GraphLoadResult::fail("first package has no Models list");
  }

  try {
    const ClassMap classes = read_object_definitions(doc);

    std::vector<Node> nodes;
    FlowGraph graph;
    for (const auto & model : models) {
      const std::string type = string_field(model, "Type");
      const json & props = field(model, "Properties");
      if (string_field(props, "Id").empty()) {
        if (diags_ != nullptr) {
          diags_->report_warning({}, "skipping model of type \"" + type + "\" without an Id")
            .with_code(diag_code::k_unsupported_node);
        }
        continue;
      }

      const std::string base = base_class(type, classes);
      if (base == "Entity") {
        graph.add_entity(read_entity(model));
        continue;
      }
      const NodeKind kind = classify(model, base);
      if (kind == NodeKind::Unsupported && !has_pins(props)) {
        // Locations, assets, documents etc. are not part of the flow.
        continue;
      }
      nodes.push_back(read_node(model, kind));
    }

    // Top-level nodes point at the Flow itself, which is not a model.
    std::unordered_set<std::string> ids;
    for (const auto & node : nodes) {
      ids.insert(node.id);
    }
    for (auto & node : nodes) {
      if (!node.parent.empty() && ids.count(node.parent) == 0) {
        node.parent.clear();
      }
      graph.add_node(std::move(node));
    }

    read_variables(doc, graph);
    graph.set_roots(read_flow_roots(doc, graph));
    graph.finalize();
    return GraphLoadResult::ok(std::move(graph));
  } catch (const json::exception & e) {
    return GraphLoadResult::fail("unexpected export layout: " + std::string(e.what()));
  }
}

// ============================================================================
// Helpers
// ============================================================================

ArticyLoader::ClassMap ArticyLoader::read_object_definitions(const json & doc)
{
  ClassMap classes;
  const json & defs = field(doc, "ObjectDefinitions");
  if (!defs.is_array()) {
    return classes;
  }
  for (const auto & def : defs) {
    const std::string type = string_field(def, "Type");
    const std::string cls = string_field(def, "Class");
    if (!type.empty() && !cls.empty()) {
      classes.emplace(type, cls);
    }
  }
  return classes;
}

std::string ArticyLoader::base_class(const std::string & type, const ClassMap & classes)
{
  const auto it = classes.find(type);
  if (it != classes.end()) {
    return it->second;
  }
  return type;
}

NodeKind ArticyLoader::classify(const json & model, const std::string & base) const
{
  const std::string type = string_field(model, "Type");
  if (contains(config_.renpy_box, type)) {
    return NodeKind::RawCode;
  }
  if (base == "FlowFragment" || base == "Dialogue") {
    return NodeKind::Container;
  }
  if (base == "DialogueFragment") {
    return NodeKind::Dialogue;
  }
  if (base == "Hub") {
    return NodeKind::Hub;
  }
  if (base == "Jump") {
    return NodeKind::Jump;
  }
  if (base == "Condition") {
    return NodeKind::Condition;
  }
  if (base == "Instruction") {
    return NodeKind::Instruction;
  }
  if (base == "Comment") {
    return NodeKind::Comment;
  }
  return NodeKind::Unsupported;
}

Pin ArticyLoader::read_pin(const json & pin, const std::string & owner, PinDirection direction)
{
  Pin out;
  out.id = string_field(pin, "Id");
  out.owner = string_field(pin, "Owner");
  if (out.owner.empty()) {
    out.owner = owner;
  }
  out.direction = direction;
  out.text = string_field(pin, "Text");

  const json & connections = field(pin, "Connections");
  if (connections.is_array()) {
    for (const auto & c : connections) {
      Connection conn;
      conn.label = string_field(c, "Label");
      conn.target_node = string_field(c, "Target");
      conn.target_pin = string_field(c, "TargetPin");
      out.connections.push_back(std::move(conn));
    }
  }
  return out;
}

Node ArticyLoader::read_node(const json & model, NodeKind kind)
{
  const json & props = field(model, "Properties");

  Node node;
  node.id = string_field(props, "Id");
  node.kind = kind;
  node.type_name = string_field(model, "Type");
  node.parent = reference_field(props, "Parent");
  node.display_name = string_field(props, "DisplayName");
  node.speaker = reference_field(props, "Speaker");
  node.text = string_field(props, "Text");
  node.menu_text = string_field(props, "MenuText");
  node.stage_directions = string_field(props, "StageDirections");
  node.expression = string_field(props, "Expression");
  node.jump_target = reference_field(props, "Target");

  const json & inputs = field(props, "InputPins");
  if (inputs.is_array()) {
    for (const auto & pin : inputs) {
      node.input_pins.push_back(read_pin(pin, node.id, PinDirection::Input));
    }
  }
  const json & outputs = field(props, "OutputPins");
  if (outputs.is_array()) {
    for (const auto & pin : outputs) {
      node.output_pins.push_back(read_pin(pin, node.id, PinDirection::Output));
    }
  }
  return node;
}

Entity ArticyLoader::read_entity(const json & model) const
{
  const json & props = field(model, "Properties");

  Entity entity;
  entity.id = string_field(props, "Id");
  entity.display_name = string_field(props, "DisplayName");
  entity.type_name = string_field(model, "Type");

  const json & tmpl = field(model, "Template");
  for (const auto & feature_name : config_.features_renpy_character_params) {
    const json & feature = field(tmpl, feature_name.c_str());
    if (!feature.is_object()) {
      continue;
    }
    for (auto it = feature.begin(); it != feature.end(); ++it) {
      const json & value = it.value();
      if (it.key() == config_.renpy_character_name) {
        if (value.is_string()) {
          entity.script_name = value.get<std::string>();
        }
        continue;
      }

      EntityParam param;
      param.name = it.key();
      if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text.empty()) {
          continue;
        }
        param.value = text;
      } else if (value.is_boolean()) {
        param.value = value.get<bool>();
      } else if (value.is_number_integer()) {
        param.value = value.get<int64_t>();
      } else if (value.is_number_float()) {
        param.value = value.get<double>();
      } else {
        if (diags_ != nullptr) {
          diags_
            ->report_note(
              {}, "ignoring character parameter \"" + it.key() + "\" of entity " + entity.id +
                    " (unsupported value type)")
            .with_node(entity.id);
        }
        continue;
      }
      entity.params.push_back(std::move(param));
    }
  }
  return entity;
}

void ArticyLoader::read_variables(const json & doc, FlowGraph & graph)
{
  const json & globals = field(doc, "GlobalVariables");
  if (!globals.is_array()) {
    return;
  }
  for (const auto & ns : globals) {
    VariableNamespace space;
    space.name = string_field(ns, "Namespace");
    space.description = string_field(ns, "Description");

    const json & vars = field(ns, "Variables");
    if (vars.is_array()) {
      for (const auto & v : vars) {
        Variable variable;
        variable.name_space = space.name;
        variable.name = string_field(v, "Variable");
        variable.type = string_field(v, "Type");
        variable.default_value = literal_field(v, "Value");
        variable.description = string_field(v, "Description");
        graph.add_variable(std::move(variable));
      }
    }
    graph.add_namespace(std::move(space));
  }
}

std::vector<std::string> ArticyLoader::read_flow_roots(const json & doc, const FlowGraph & graph)
{
  std::vector<std::string> roots;
  const json & children = field(field(doc, "Hierarchy"), "Children");
  if (!children.is_array()) {
    return roots;
  }
  for (const auto & child : children) {
    if (string_field(child, "Type") != "Flow") {
      continue;
    }
    const json & flow_children = field(child, "Children");
    if (!flow_children.is_array()) {
      continue;
    }
    for (const auto & item : flow_children) {
      const std::string id = string_field(item, "Id");
      if (graph.find_node(id) != nullptr) {
        roots.push_back(id);
      }
    }
  }
  return roots;
}

}  // namespace rpyflow
