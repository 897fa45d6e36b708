// rpyflow/basic/diagnostic.hpp - Diagnostic types for compilation
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rpyflow
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Note,
};

/**
 * What a diagnostic points at.
 *
 * `file` is the generated file the diagnostic belongs to, relative to the
 * target directory with '/' separators. An empty file means the diagnostic is
 * not tied to any generated file.
 */
struct DiagnosticLocation
{
  std::string file;
  std::string node_id;
  std::string label;  // label assigned to node_id, if known

  [[nodiscard]] bool has_file() const noexcept { return !file.empty(); }
  [[nodiscard]] bool has_label() const noexcept { return !label.empty(); }
};

struct Diagnostic
{
  Severity severity = Severity::Warning;
  std::string code;  // e.g., "W001"
  std::string message;
  DiagnosticLocation location;
  std::optional<std::string> help_message;
};

/// Stable diagnostic codes.
namespace diag_code
{
inline constexpr const char * k_compile_failed = "E001";
inline constexpr const char * k_unsafe_target_dir = "E002";
inline constexpr const char * k_load_failed = "E003";
inline constexpr const char * k_dangling_jump = "W001";
inline constexpr const char * k_marker_line = "N002";
inline constexpr const char * k_missing_asset = "W003";
inline constexpr const char * k_unknown_directive = "W004";
inline constexpr const char * k_bad_directive_value = "W005";
inline constexpr const char * k_unsupported_node = "W006";
inline constexpr const char * k_unknown_speaker = "W007";
inline constexpr const char * k_unresolved_jump = "W008";
inline constexpr const char * k_no_game_dir = "N009";
inline constexpr const char * k_unguarded_condition = "W010";
}  // namespace diag_code

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and registers it in the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_node(std::string node_id, std::string label = "");

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(DiagnosticLocation where, std::string message);
  DiagnosticBuilder report_warning(DiagnosticLocation where, std::string message);
  DiagnosticBuilder report_note(DiagnosticLocation where, std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] std::vector<Diagnostic> with_code(const std::string & code) const;
  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  template <typename Pred>
  [[nodiscard]] std::vector<Diagnostic> select(Pred pred) const
  {
    std::vector<Diagnostic> result;
    for (const auto & d : diagnostics_) {
      if (pred(d)) {
        result.push_back(d);
      }
    }
    return result;
  }

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace rpyflow
