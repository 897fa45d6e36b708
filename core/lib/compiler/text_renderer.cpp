// rpyflow/compiler/text_renderer.cpp - Text to Ren'Py script literal conversion
//
#include "rpyflow/compiler/text_renderer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace rpyflow
{

namespace
{

constexpr std::array<std::string_view, 5> k_image_extensions = {
  ".png", ".webp", ".gif", ".jpg", ".jpeg"};
constexpr std::array<std::string_view, 5> k_audio_extensions = {
  ".ogg", ".mp3", ".wav", ".opus", ".flac"};

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool is_ident_char(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string to_lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string_view trim(std::string_view s)
{
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

bool ends_with(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template <size_t N>
bool ends_with_any(std::string_view path, const std::array<std::string_view, N> & suffixes)
{
  const std::string lower = to_lower(path);
  return std::any_of(suffixes.begin(), suffixes.end(), [&](std::string_view ext) {
    return ends_with(lower, ext);
  });
}

struct EmphasisMarker
{
  std::string_view marker;
  std::string_view open;
  std::string_view close;
};

constexpr EmphasisMarker k_bold{"**", "{b}", "{/b}"};
constexpr EmphasisMarker k_italic{"*", "{i}", "{/i}"};
constexpr EmphasisMarker k_underline{"_", "{u}", "{/u}"};

/// Markers open and close left to right; only the innermost open marker can
/// close, so tags never cross. Unclosed markers stay literal text.
std::string style_segment(std::string_view segment)
{
  struct OpenMarker
  {
    const EmphasisMarker * kind;
    size_t piece;
  };
  std::vector<std::string> pieces;
  std::vector<OpenMarker> stack;

  const auto is_open = [&](const EmphasisMarker * kind) {
    return std::any_of(
      stack.begin(), stack.end(), [kind](const OpenMarker & m) { return m.kind == kind; });
  };

  const auto take = [&](const EmphasisMarker * kind) {
    if (!stack.empty() && stack.back().kind == kind) {
      // Empty spans are not styled.
      if (stack.back().piece + 1 == pieces.size()) {
        pieces.emplace_back(kind->marker);
        return;
      }
      pieces[stack.back().piece] = std::string(kind->open);
      pieces.emplace_back(kind->close);
      stack.pop_back();
      return;
    }
    pieces.emplace_back(kind->marker);
    if (!is_open(kind)) {
      stack.push_back(OpenMarker{kind, pieces.size() - 1});
    }
  };

  size_t i = 0;
  while (i < segment.size()) {
    const char c = segment[i];
    if (c == '_') {
      take(&k_underline);
      ++i;
      continue;
    }
    if (c != '*') {
      const size_t next = segment.find_first_of("*_", i);
      const size_t end = next == std::string_view::npos ? segment.size() : next;
      pieces.emplace_back(segment.substr(i, end - i));
      i = end;
      continue;
    }

    size_t run = segment.find_first_not_of('*', i);
    run = (run == std::string_view::npos ? segment.size() : run) - i;
    i += run;
    while (run > 0) {
      const bool italic_on_top = !stack.empty() && stack.back().kind == &k_italic;
      if (run >= 2 && !(run != 2 && italic_on_top)) {
        take(&k_bold);
        run -= 2;
      } else {
        take(&k_italic);
        run -= 1;
      }
    }
  }

  std::string out;
  for (const auto & piece : pieces) {
    out += piece;
  }
  return out;
}

/// Append `word` as a separate token (single spaces around it).
void append_word(std::string & out, std::string_view word, bool space_after)
{
  if (!out.empty() && !is_space(out.back())) {
    out.push_back(' ');
  }
  out.append(word);
  if (space_after) {
    out.push_back(' ');
  }
}

std::string replace_keyword(std::string_view text, std::string_view word, std::string_view with)
{
  std::string out;
  size_t i = 0;
  while (i < text.size()) {
    if (text.compare(i, word.size(), word) == 0) {
      const bool left_ok = i == 0 || !is_ident_char(text[i - 1]);
      const size_t after = i + word.size();
      const bool right_ok = after >= text.size() || !is_ident_char(text[after]);
      if (left_ok && right_ok) {
        out.append(with);
        i = after;
        continue;
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

}  // namespace

// ============================================================================
// Line utilities
// ============================================================================

std::vector<std::string> split_lines(std::string_view text)
{
  std::vector<std::string> lines;
  if (text.empty()) {
    return lines;
  }
  std::string current;
  for (const char c : text) {
    if (c == '\r') {
      continue;
    }
    if (c == '\n') {
      lines.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  lines.push_back(std::move(current));
  return lines;
}

std::vector<std::string> split_paragraphs(std::string_view text)
{
  std::vector<std::string> paragraphs;
  std::string current;
  for (const auto & line : split_lines(text)) {
    if (trim(line).empty()) {
      if (!current.empty()) {
        paragraphs.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    if (!current.empty()) {
      current.push_back('\n');
    }
    current += line;
  }
  if (!current.empty()) {
    paragraphs.push_back(std::move(current));
  }
  return paragraphs;
}

// ============================================================================
// Say text
// ============================================================================

std::string escape_text(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '"' || c == '\'' || c == '%') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

std::string apply_markdown(std::string_view line)
{
  std::string out;
  size_t pos = 0;
  while (pos < line.size()) {
    const size_t open = line.find('[', pos);
    const size_t close = open == std::string_view::npos ? open : line.find(']', open + 1);
    if (open == std::string_view::npos || close == std::string_view::npos) {
      out += style_segment(line.substr(pos));
      break;
    }
    out += style_segment(line.substr(pos, open - pos));
    out.append(line.substr(open, close - open + 1));
    pos = close + 1;
  }
  return out;
}

// ============================================================================
// Raw code
// ============================================================================

bool has_image_extension(std::string_view path) { return ends_with_any(path, k_image_extensions); }

bool has_asset_extension(std::string_view path)
{
  return ends_with_any(path, k_image_extensions) || ends_with_any(path, k_audio_extensions);
}

std::string infer_brace_paths(std::string_view line, std::string_view container_path)
{
  std::string out;
  size_t pos = 0;
  while (pos < line.size()) {
    const size_t open = line.find('{', pos);
    const size_t close = open == std::string_view::npos ? open : line.find('}', open + 1);
    if (open == std::string_view::npos || close == std::string_view::npos) {
      out.append(line.substr(pos));
      break;
    }
    out.append(line.substr(pos, open - pos));

    std::string_view token = line.substr(open + 1, close - open - 1);
    if (!has_image_extension(token)) {
      out.append(line.substr(open, close - open + 1));
      pos = close + 1;
      continue;
    }

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= container_path.size()) {
      size_t slash = container_path.find('/', start);
      if (slash == std::string_view::npos) {
        slash = container_path.size();
      }
      if (slash > start) {
        segments.emplace_back(container_path.substr(start, slash - start));
      }
      start = slash + 1;
    }
    while (token.compare(0, 3, "../") == 0) {
      if (!segments.empty()) {
        segments.pop_back();
      }
      token.remove_prefix(3);
    }

    std::string path = "images/";
    for (const auto & segment : segments) {
      path += segment;
      path += '/';
    }
    path.append(token);

    out += '\'';
    out += path;
    out += '\'';
    pos = close + 1;
  }
  return out;
}

std::vector<std::string> find_asset_references(std::string_view line)
{
  std::vector<std::string> refs;
  size_t pos = 0;
  while (pos < line.size()) {
    const size_t open = line.find_first_of("\"'", pos);
    if (open == std::string_view::npos) {
      break;
    }
    const size_t close = line.find(line[open], open + 1);
    if (close == std::string_view::npos) {
      break;
    }
    const std::string_view content = line.substr(open + 1, close - open - 1);
    if (has_asset_extension(content)) {
      refs.emplace_back(content);
    }
    pos = close + 1;
  }
  return refs;
}

bool is_marker_line(std::string_view line, const std::vector<std::string> & prefixes)
{
  while (!line.empty() && is_space(line.front())) {
    line.remove_prefix(1);
  }
  const std::string lower = to_lower(line);
  return std::any_of(prefixes.begin(), prefixes.end(), [&](const std::string & prefix) {
    return !prefix.empty() && lower.rfind(to_lower(prefix), 0) == 0;
  });
}

// ============================================================================
// Expressions
// ============================================================================

std::string translate_expression(std::string_view expression)
{
  std::string flat(expression);
  std::replace(flat.begin(), flat.end(), '\r', ' ');
  std::replace(flat.begin(), flat.end(), '\n', ' ');

  flat = replace_keyword(flat, "true", "True");
  flat = replace_keyword(flat, "false", "False");

  std::string out;
  out.reserve(flat.size() + 8);
  for (size_t i = 0; i < flat.size(); ++i) {
    const char c = flat[i];
    const char next = i + 1 < flat.size() ? flat[i + 1] : '\0';
    if ((c == '&' && next == '&') || (c == '|' && next == '|')) {
      const char after = i + 2 < flat.size() ? flat[i + 2] : ' ';
      append_word(out, c == '&' ? "and" : "or", !is_space(after));
      ++i;
      continue;
    }
    if (c == '!' && next != '=' && next != '\0') {
      out.append("not");
      if (!is_space(next)) {
        out.push_back(' ');
      }
      continue;
    }
    out.push_back(c);
  }
  return std::string(trim(out));
}

std::vector<std::string> split_instructions(std::string_view expression)
{
  std::vector<std::string> statements;
  const std::string translated = translate_expression(expression);
  size_t start = 0;
  while (start <= translated.size()) {
    size_t semi = translated.find(';', start);
    if (semi == std::string::npos) {
      semi = translated.size();
    }
    const std::string_view stmt = trim(std::string_view(translated).substr(start, semi - start));
    if (!stmt.empty()) {
      statements.emplace_back(stmt);
    }
    start = semi + 1;
  }
  return statements;
}

// ============================================================================
// TextRenderer
// ============================================================================

TextRenderer::TextRenderer(
  const AssetIndex * assets, std::vector<std::string> marker_prefixes, DiagnosticBag & diags)
: assets_(assets), marker_prefixes_(std::move(marker_prefixes)), diags_(diags)
{
}

std::vector<std::string> TextRenderer::render_say_text(std::string_view text, bool markdown) const
{
  std::vector<std::string> out;
  for (const auto & paragraph : split_paragraphs(text)) {
    std::string literal;
    for (const auto & line : split_lines(paragraph)) {
      if (!literal.empty()) {
        literal += "\\n";
      }
      const std::string escaped = escape_text(line);
      literal += markdown ? apply_markdown(escaped) : escaped;
    }
    out.push_back(std::move(literal));
  }
  return out;
}

std::string TextRenderer::render_choice_text(std::string_view text, bool markdown) const
{
  std::string literal;
  for (const auto & line : split_lines(text)) {
    const std::string_view content = trim(line);
    if (content.empty()) {
      continue;
    }
    if (!literal.empty()) {
      literal += ' ';
    }
    const std::string escaped = escape_text(content);
    literal += markdown ? apply_markdown(escaped) : escaped;
  }
  return literal;
}

std::vector<std::string> TextRenderer::render_code_lines(
  std::string_view code, const CodeContext & ctx, const DiagnosticLocation & where) const
{
  std::vector<std::string> out;
  for (const auto & line : split_lines(code)) {
    if (trim(line).empty()) {
      continue;
    }

    std::string rendered =
      ctx.relative_imgs_in_braces ? infer_brace_paths(line, ctx.container_path) : line;

    if (assets_ != nullptr) {
      for (const auto & ref : find_asset_references(rendered)) {
        if (!assets_->contains(ref)) {
          diags_.report_warning(where, "references non-existent file \"" + ref + "\"")
            .with_code(diag_code::k_missing_asset);
        }
      }
    }

    if (is_marker_line(line, marker_prefixes_)) {
      diags_.report_note(where, "contains the following line: " + std::string(trim(line)))
        .with_code(diag_code::k_marker_line);
    }

    out.push_back(std::move(rendered));
  }
  return out;
}

}  // namespace rpyflow
