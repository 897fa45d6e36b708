// rpyflow/driver/log_report.hpp - Compile log grouped by generated file
//
// Output format:
//   chapter_1/articy_chapter_1.rpy
//       label_0x01 was not assigned any jump target in Articy, will jump to "end"
//       label_0x07 contains the following line: # TODO: music
//   <global>
//       no Ren'Py game directory found ...
//
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "rpyflow/basic/diagnostic.hpp"

namespace rpyflow
{

class LogReport
{
public:
  /// Header of diagnostics that belong to no generated file
  static constexpr const char * k_global_group = "<global>";

  void add(const Diagnostic & diag);
  void add_all(const DiagnosticBag & diags);

  /// Groups in discovery order, entries in insertion order.
  [[nodiscard]] std::string render() const;

  [[nodiscard]] bool empty() const noexcept { return groups_.empty(); }
  [[nodiscard]] size_t entry_count() const noexcept { return entries_; }

private:
  struct Group
  {
    std::string header;
    std::vector<std::string> lines;
  };

  std::vector<Group> groups_;
  std::unordered_map<std::string, size_t> index_;
  size_t entries_ = 0;
};

}  // namespace rpyflow
