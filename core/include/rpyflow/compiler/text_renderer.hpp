// rpyflow/compiler/text_renderer.hpp - Text to Ren'Py script literal conversion
//
// Say text:  escaping, optional markdown emphasis, paragraphs.
// Raw code:  {image.png} path inference, asset checks, marker lines.
// Expressions: Articy condition/instruction syntax -> Python.
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "rpyflow/basic/diagnostic.hpp"
#include "rpyflow/compiler/asset_index.hpp"

namespace rpyflow
{

// ============================================================================
// Line utilities
// ============================================================================

/// Split on '\n' after dropping '\r' (CRLF and LF input give the same lines).
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

/**
 * Split into paragraphs separated by blank lines. Lines inside one paragraph
 * stay joined with '\n'.
 */
[[nodiscard]] std::vector<std::string> split_paragraphs(std::string_view text);

// ============================================================================
// Say text
// ============================================================================

/// Escape `"`, `'` and `%` for a Ren'Py string literal.
[[nodiscard]] std::string escape_text(std::string_view text);

/**
 * Replace `**b**`, `*i*` and `_u_` with {b}, {i} and {u} text tags.
 *
 * Spans must be non-empty and paired on the same line; unpaired markers stay
 * literal. Text inside `[...]` is left untouched.
 */
[[nodiscard]] std::string apply_markdown(std::string_view line);

// ============================================================================
// Raw code
// ============================================================================

/// True if `path` ends in a known image extension (any case).
[[nodiscard]] bool has_image_extension(std::string_view path);

/// True if `path` ends in a known image or audio extension (any case).
[[nodiscard]] bool has_asset_extension(std::string_view path);

/**
 * Rewrite `{name.png}` tokens to `'images/<container_path>/name.png'`.
 * Leading `../` segments in the token walk up `container_path`.
 */
[[nodiscard]] std::string infer_brace_paths(std::string_view line, std::string_view container_path);

/// Quoted substrings of `line` that end in an image or audio extension.
[[nodiscard]] std::vector<std::string> find_asset_references(std::string_view line);

/// True if the line (leading indentation ignored, lower-cased) starts with a prefix.
[[nodiscard]] bool is_marker_line(std::string_view line, const std::vector<std::string> & prefixes);

// ============================================================================
// Expressions
// ============================================================================

/**
 * Translate an Articy expression to Python:
 * `true`/`false` -> `True`/`False`, `&&` -> `and`, `||` -> `or`,
 * `!` (not part of `!=`) -> `not`. Line breaks become spaces.
 */
[[nodiscard]] std::string translate_expression(std::string_view expression);

/// Translate and split an instruction list on ';' (empty statements dropped).
[[nodiscard]] std::vector<std::string> split_instructions(std::string_view expression);

// ============================================================================
// TextRenderer
// ============================================================================

struct CodeContext
{
  /// Directory of the node's container relative to the target dir ('/' separated)
  std::string container_path;

  bool relative_imgs_in_braces = false;
};

/**
 * Renders node text and reports asset and marker findings.
 */
class TextRenderer
{
public:
  /**
   * @param assets Known game files; nullptr disables asset checks
   * @param marker_prefixes Raw code lines starting with one of these are reported
   * @param diags Receives the findings
   */
  TextRenderer(
    const AssetIndex * assets, std::vector<std::string> marker_prefixes, DiagnosticBag & diags);

  /// One escaped (and optionally styled) literal per paragraph.
  [[nodiscard]] std::vector<std::string> render_say_text(std::string_view text, bool markdown) const;

  /// Single literal for a menu choice; lines are joined with spaces.
  [[nodiscard]] std::string render_choice_text(std::string_view text, bool markdown) const;

  /**
   * Render raw code line by line. Blank lines are dropped, indentation inside
   * the code is kept.
   */
  [[nodiscard]] std::vector<std::string> render_code_lines(
    std::string_view code, const CodeContext & ctx, const DiagnosticLocation & where) const;

private:
  const AssetIndex * assets_;
  std::vector<std::string> marker_prefixes_;
  DiagnosticBag & diags_;
};

}  // namespace rpyflow
