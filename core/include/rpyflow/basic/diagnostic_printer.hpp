// rpyflow/basic/diagnostic_printer.hpp
//
// Prints diagnostics in Rust-style format with the node they point at.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "rpyflow/basic/diagnostic.hpp"

namespace rpyflow
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[W001]: was not assigned any jump target in Articy, will jump to "end"
 *     --> chapter_1/rpy_chapter_1.rpy (a_0x01000000000001A3)
 *      |
 *      = help: connect the output pin in Articy
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print a single diagnostic.
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag.
   *
   * Errors come first, then warnings, then notes; order within a severity is kept.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_help(std::string_view message);

  [[nodiscard]] static std::string location_text(const DiagnosticLocation & where);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace rpyflow
