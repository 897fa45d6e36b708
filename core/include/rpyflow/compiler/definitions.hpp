// rpyflow/compiler/definitions.hpp - Character and variable definition files
//
#pragma once

#include <string>

#include "rpyflow/compiler/compile_session.hpp"

namespace rpyflow
{

/**
 * Renders the characters and variables files.
 *
 * write_characters() also registers every entity's character name in the
 * session; it must run before any dialogue node is compiled.
 */
class DefinitionsWriter
{
public:
  explicit DefinitionsWriter(CompileSession & session) : session_(session) {}

  /**
   * One `define <prefix><name> = Character("<Display Name>", k=v, ...)` per entity.
   */
  [[nodiscard]] std::string write_characters();

  /**
   * One `init python in <Namespace>:` block per variable namespace.
   *
   * @throws CompileError on an unsupported type or a malformed default value
   */
  [[nodiscard]] std::string write_variables() const;

  /// Character name (without prefix) derived from an entity.
  [[nodiscard]] static std::string base_character_name(const Entity & entity);

  /// Python literal of a variable's default value.
  [[nodiscard]] static std::string variable_literal(const Variable & variable);

private:
  CompileSession & session_;
};

}  // namespace rpyflow
