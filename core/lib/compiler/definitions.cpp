// rpyflow/compiler/definitions.cpp - Character and variable definition files
//
#include "rpyflow/compiler/definitions.hpp"

#include <fmt/format.h>

#include <cctype>
#include <unordered_set>

#include "rpyflow/basic/errors.hpp"

namespace rpyflow
{

namespace
{

constexpr const char * k_indent = "    ";

std::string param_literal(const ParamValue & value)
{
  if (const auto * s = std::get_if<std::string>(&value)) {
    return "\"" + escape_text(*s) + "\"";
  }
  if (const auto * b = std::get_if<bool>(&value)) {
    return *b ? "True" : "False";
  }
  if (const auto * i = std::get_if<int64_t>(&value)) {
    return fmt::format("{}", *i);
  }
  return fmt::format("{}", std::get<double>(value));
}

void append_comments(std::string & out, const std::string & text)
{
  for (const auto & line : split_lines(text)) {
    if (!line.empty()) {
      out += fmt::format("{}# {}\n", k_indent, line);
    }
  }
}

}  // namespace

std::string DefinitionsWriter::base_character_name(const Entity & entity)
{
  std::string name = entity.script_name;
  if (name.empty()) {
    name = entity.display_name.substr(0, entity.display_name.find(' '));
    for (auto & c : name) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }
  // Keep it a valid Python identifier.
  for (auto & c : name) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
      c = '_';
    }
  }
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    name.insert(0, "c_");
  }
  return name;
}

std::string DefinitionsWriter::write_characters()
{
  const std::string & prefix = session_.renpy().character_prefix;
  std::unordered_set<std::string> taken;

  std::string out;
  for (const auto & entity : session_.graph().entities()) {
    const std::string base = prefix + base_character_name(entity);
    std::string name = base;
    for (int n = 1; taken.count(name) != 0; ++n) {
      name = fmt::format("{}_{}", base, n);
    }
    taken.insert(name);
    session_.set_character_name(entity.id, name);

    std::string args = "\"" + escape_text(entity.display_name) + "\"";
    for (const auto & param : entity.params) {
      args += fmt::format(", {}={}", param.name, param_literal(param.value));
    }
    out += fmt::format("define {} = Character({})\n", name, args);
  }
  return out;
}

std::string DefinitionsWriter::variable_literal(const Variable & variable)
{
  const std::string qualified = variable.name_space + "." + variable.name;
  if (variable.type == "Boolean") {
    if (const auto value = parse_bool_literal(variable.default_value)) {
      return *value ? "True" : "False";
    }
    throw CompileError(
      "", fmt::format(
            "variable {} has Boolean default \"{}\"", qualified, variable.default_value));
  }
  if (variable.type == "Integer") {
    if (const auto value = parse_int_literal(variable.default_value)) {
      return fmt::format("{}", *value);
    }
    throw CompileError(
      "", fmt::format(
            "variable {} has Integer default \"{}\"", qualified, variable.default_value));
  }
  if (variable.type == "String") {
    return "\"" + escape_text(variable.default_value) + "\"";
  }
  throw CompileError(
    "", fmt::format("variable {} has unsupported type \"{}\"", qualified, variable.type));
}

std::string DefinitionsWriter::write_variables() const
{
  const FlowGraph & graph = session_.graph();

  std::string out;
  for (const auto & ns : graph.namespaces()) {
    if (!out.empty()) {
      out += '\n';
    }
    out += fmt::format("init python in {}:\n", ns.name);
    append_comments(out, ns.description);

    bool any = false;
    for (const auto & variable : graph.variables()) {
      if (variable.name_space != ns.name) {
        continue;
      }
      append_comments(out, variable.description);
      out += fmt::format("{}{} = {}\n", k_indent, variable.name, variable_literal(variable));
      any = true;
    }
    if (!any) {
      out += fmt::format("{}pass\n", k_indent);
    }
  }
  return out;
}

}  // namespace rpyflow
