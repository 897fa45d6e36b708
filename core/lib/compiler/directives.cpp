// rpyflow/compiler/directives.cpp - Stage direction parsing
//
#include "rpyflow/compiler/directives.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace rpyflow
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

std::string unquote(std::string_view s)
{
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
    s = s.substr(1, s.size() - 2);
  }
  return std::string(s);
}

std::string to_lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

/// Returns the segments of `raw` separated by top-level commas.
///
/// A quote only opens at the start of a segment or of a value; an apostrophe
/// inside a bare word is literal.
std::vector<std::string_view> split_top_level(std::string_view raw)
{
  std::vector<std::string_view> parts;
  char quote = 0;
  bool value_start = true;
  size_t start = 0;
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (quote != 0) {
      if (c == quote) {
        quote = 0;
      }
    } else if ((c == '"' || c == '\'') && value_start) {
      quote = c;
      value_start = false;
    } else if (c == ',') {
      parts.push_back(raw.substr(start, i - start));
      start = i + 1;
      value_start = true;
    } else if (c == '=') {
      value_start = true;
    } else if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      value_start = false;
    }
  }
  parts.push_back(raw.substr(start));
  return parts;
}

}  // namespace

std::string_view to_string(OptionType type)
{
  switch (type) {
    case OptionType::String:
      return "a string";
    case OptionType::Bool:
      return "a boolean";
    case OptionType::Int:
      return "an integer";
  }
  return "a value";
}

// ============================================================================
// DirectiveSchema
// ============================================================================

void DirectiveSchema::add(OptionSpec spec)
{
  for (auto & existing : options_) {
    if (existing.name == spec.name) {
      existing = std::move(spec);
      return;
    }
  }
  options_.push_back(std::move(spec));
}

const OptionSpec * DirectiveSchema::find(std::string_view name) const
{
  for (const auto & spec : options_) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

DirectiveSchema DirectiveSchema::standard(const RenpyConfig & config)
{
  DirectiveSchema schema;
  schema.add({directive::k_label, OptionType::String, std::nullopt});
  schema.add({directive::k_speaker, OptionType::String, std::nullopt});
  schema.add({directive::k_before, OptionType::String, std::nullopt});
  schema.add({directive::k_after, OptionType::String, std::nullopt});
  schema.add({directive::k_choice_index, OptionType::Int, std::nullopt});
  schema.add({directive::k_display_text_box, OptionType::Bool, config.menu_display_text_box});
  schema.add({directive::k_markdown, OptionType::Bool, config.markdown_text_styles});
  schema.add(
    {directive::k_relative_imgs_in_braces, OptionType::Bool, config.relative_imgs_in_braces});
  schema.add({directive::k_repeat_menu_text, OptionType::Bool, config.repeat_menu_text});
  return schema;
}

// ============================================================================
// DirectiveSet
// ============================================================================

std::optional<std::string> DirectiveSet::get_string(std::string_view name) const
{
  const auto it = values_.find(name);
  if (it == values_.end()) {
    return std::nullopt;
  }
  if (const auto * s = std::get_if<std::string>(&it->second)) {
    return *s;
  }
  return std::nullopt;
}

std::optional<bool> DirectiveSet::get_bool(std::string_view name) const
{
  const auto it = values_.find(name);
  if (it == values_.end()) {
    return std::nullopt;
  }
  if (const auto * b = std::get_if<bool>(&it->second)) {
    return *b;
  }
  return std::nullopt;
}

std::optional<int64_t> DirectiveSet::get_int(std::string_view name) const
{
  const auto it = values_.find(name);
  if (it == values_.end()) {
    return std::nullopt;
  }
  if (const auto * i = std::get_if<int64_t>(&it->second)) {
    return *i;
  }
  return std::nullopt;
}

// ============================================================================
// Parsing
// ============================================================================

std::optional<bool> parse_bool_literal(std::string_view text)
{
  const std::string lower = to_lower(trim(text));
  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  return std::nullopt;
}

std::optional<int64_t> parse_int_literal(std::string_view text)
{
  text = trim(text);
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }
  int64_t value = 0;
  const char * first = text.data();
  const char * last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::vector<RawDirective> split_directives(std::string_view raw)
{
  std::vector<RawDirective> out;
  for (const std::string_view part : split_top_level(raw)) {
    const std::string_view entry = trim(part);
    if (entry.empty()) {
      continue;
    }

    // '=' inside a quoted key is not expected; the first one separates key and value.
    const auto eq = entry.find('=');
    RawDirective d;
    if (eq == std::string_view::npos) {
      d.key = unquote(entry);
    } else {
      d.key = std::string(trim(entry.substr(0, eq)));
      d.value = unquote(trim(entry.substr(eq + 1)));
    }
    if (!d.key.empty()) {
      out.push_back(std::move(d));
    }
  }
  return out;
}

DirectiveSet parse_directives(
  std::string_view raw, const DirectiveSchema & schema, DiagnosticBag & diags,
  const DiagnosticLocation & where)
{
  DirectiveSet set;
  for (const auto & spec : schema.options()) {
    if (spec.default_value) {
      set.set(spec.name, *spec.default_value);
    }
  }

  for (const auto & entry : split_directives(raw)) {
    std::string key = entry.key;
    std::optional<std::string> value = entry.value;

    // A bare number is the choice index.
    if (!value && parse_int_literal(key)) {
      value = key;
      key = directive::k_choice_index;
    }

    const OptionSpec * spec = schema.find(key);
    if (spec == nullptr) {
      diags.report_warning(where, "has unknown stage direction \"" + key + "\"")
        .with_code(diag_code::k_unknown_directive)
        .with_help("known stage directions are label, speaker, before, after, choice_index and "
                   "the boolean switches");
      continue;
    }

    switch (spec->type) {
      case OptionType::String:
        if (!value) {
          diags
            .report_warning(
              where, "stage direction \"" + key + "\" expects a string value; ignoring it")
            .with_code(diag_code::k_bad_directive_value);
          break;
        }
        set.set(spec->name, *value);
        break;

      case OptionType::Bool: {
        if (!value) {
          set.set(spec->name, true);
          break;
        }
        const auto b = parse_bool_literal(*value);
        if (!b) {
          diags
            .report_warning(
              where, "stage direction \"" + key + "\" expects " +
                       std::string(to_string(spec->type)) + ", got \"" + *value +
                       "\"; using default")
            .with_code(diag_code::k_bad_directive_value);
          break;
        }
        set.set(spec->name, *b);
        break;
      }

      case OptionType::Int: {
        const auto i = value ? parse_int_literal(*value) : std::nullopt;
        if (!i) {
          diags
            .report_warning(
              where, "stage direction \"" + key + "\" expects " +
                       std::string(to_string(spec->type)) + ", got \"" + value.value_or("") +
                       "\"; using default")
            .with_code(diag_code::k_bad_directive_value);
          break;
        }
        set.set(spec->name, *i);
        break;
      }
    }
  }
  return set;
}

}  // namespace rpyflow
