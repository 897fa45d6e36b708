// rpyflow/basic/diagnostic.cpp - Diagnostic implementation
#include "rpyflow/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace rpyflow
{

namespace
{

Diagnostic make_diagnostic(Severity severity, DiagnosticLocation where, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.location = std::move(where);
  return d;
}

}  // namespace

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_node(std::string node_id, std::string label)
{
  diagnostic_.location.node_id = std::move(node_id);
  if (!label.empty()) {
    diagnostic_.location.label = std::move(label);
  }
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(DiagnosticLocation where, std::string message)
{
  return {*this, make_diagnostic(Severity::Error, std::move(where), std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(DiagnosticLocation where, std::string message)
{
  return {*this, make_diagnostic(Severity::Warning, std::move(where), std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_note(DiagnosticLocation where, std::string message)
{
  return {*this, make_diagnostic(Severity::Note, std::move(where), std::move(message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  return select([](const Diagnostic & d) { return d.severity == Severity::Error; });
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  return select([](const Diagnostic & d) { return d.severity == Severity::Warning; });
}

std::vector<Diagnostic> DiagnosticBag::with_code(const std::string & code) const
{
  return select([&code](const Diagnostic & d) { return d.code == code; });
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

bool DiagnosticBag::has_errors() const { return count(Severity::Error) != 0; }

bool DiagnosticBag::has_warnings() const { return count(Severity::Warning) != 0; }

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace rpyflow
