// rpyflow/driver/log_report.cpp - Compile log grouped by generated file
//
#include "rpyflow/driver/log_report.hpp"

namespace rpyflow
{

void LogReport::add(const Diagnostic & diag)
{
  const std::string header = diag.location.has_file() ? diag.location.file : k_global_group;
  auto it = index_.find(header);
  if (it == index_.end()) {
    it = index_.emplace(header, groups_.size()).first;
    groups_.push_back(Group{header, {}});
  }

  std::string line = diag.location.has_label() ? diag.location.label + " " : std::string();
  line += diag.message;
  groups_[it->second].lines.push_back(std::move(line));
  ++entries_;
}

void LogReport::add_all(const DiagnosticBag & diags)
{
  for (const auto & diag : diags) {
    add(diag);
  }
}

std::string LogReport::render() const
{
  std::string out;
  for (const auto & group : groups_) {
    out += group.header;
    out += '\n';
    for (const auto & line : group.lines) {
      out += "    ";
      out += line;
      out += '\n';
    }
  }
  return out;
}

}  // namespace rpyflow
