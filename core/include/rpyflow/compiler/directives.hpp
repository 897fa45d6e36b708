// rpyflow/compiler/directives.hpp - Stage direction parsing
//
// A node's stage directions are a comma separated list of `key=value` or bare
// `key` entries, e.g.  `label="intro", speaker="Narrator", 2, markdown=off`.
// They are resolved against a typed option registry into a DirectiveSet.
//
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "rpyflow/basic/diagnostic.hpp"
#include "rpyflow/project/project_config.hpp"

namespace rpyflow
{

/// Names of the recognized options.
namespace directive
{
inline constexpr const char * k_label = "label";
inline constexpr const char * k_speaker = "speaker";
inline constexpr const char * k_before = "before";
inline constexpr const char * k_after = "after";
inline constexpr const char * k_choice_index = "choice_index";
inline constexpr const char * k_display_text_box = "display_text_box";
inline constexpr const char * k_markdown = "markdown";
inline constexpr const char * k_relative_imgs_in_braces = "relative_imgs_in_braces";
inline constexpr const char * k_repeat_menu_text = "repeat_menu_text";
}  // namespace directive

enum class OptionType : uint8_t {
  String,
  Bool,
  Int,
};

[[nodiscard]] std::string_view to_string(OptionType type);

using DirectiveValue = std::variant<std::string, bool, int64_t>;

struct OptionSpec
{
  std::string name;
  OptionType type = OptionType::String;

  /// Value used when the node does not set the option; nullopt means "unset"
  std::optional<DirectiveValue> default_value;
};

/**
 * Registry of recognized options.
 */
class DirectiveSchema
{
public:
  DirectiveSchema() = default;

  void add(OptionSpec spec);

  [[nodiscard]] const OptionSpec * find(std::string_view name) const;

  [[nodiscard]] const std::vector<OptionSpec> & options() const noexcept { return options_; }

  /// The built-in options, with boolean defaults taken from the project config.
  [[nodiscard]] static DirectiveSchema standard(const RenpyConfig & config);

private:
  std::vector<OptionSpec> options_;
};

/**
 * Resolved options of one node: schema defaults overlaid with the node's
 * own entries.
 */
class DirectiveSet
{
public:
  DirectiveSet() = default;

  void set(const std::string & name, DirectiveValue value) { values_[name] = std::move(value); }

  [[nodiscard]] bool has(std::string_view name) const { return values_.find(name) != values_.end(); }

  [[nodiscard]] std::optional<std::string> get_string(std::string_view name) const;
  [[nodiscard]] std::optional<bool> get_bool(std::string_view name) const;
  [[nodiscard]] std::optional<int64_t> get_int(std::string_view name) const;

  /// Boolean option, false when unset
  [[nodiscard]] bool flag(std::string_view name) const { return get_bool(name).value_or(false); }

private:
  std::map<std::string, DirectiveValue, std::less<>> values_;
};

/**
 * One raw `key[=value]` entry.
 */
struct RawDirective
{
  std::string key;
  std::optional<std::string> value;
};

/**
 * Split a stage direction string into entries.
 *
 * Commas inside single or double quotes do not separate entries. Keys and
 * values are trimmed; values wrapped in matching quotes are unquoted. Empty
 * entries are dropped.
 */
[[nodiscard]] std::vector<RawDirective> split_directives(std::string_view raw);

/**
 * Parse a stage direction string against a schema.
 *
 * Unknown keys and values that do not convert to the option's type are
 * reported to `diags` (at `where`) and otherwise ignored. A bare integer
 * entry sets `choice_index`; a bare key sets a boolean option to true.
 */
[[nodiscard]] DirectiveSet parse_directives(
  std::string_view raw, const DirectiveSchema & schema, DiagnosticBag & diags,
  const DiagnosticLocation & where);

/// Parse a boolean literal (true/false/yes/no/on/off/1/0, any case).
[[nodiscard]] std::optional<bool> parse_bool_literal(std::string_view text);

/// Parse a decimal integer (optional sign); the whole text must be consumed.
[[nodiscard]] std::optional<int64_t> parse_int_literal(std::string_view text);

}  // namespace rpyflow
