// test_log_report.cpp - Compile log grouped by generated file

#include <gtest/gtest.h>

#include "rpyflow/driver/log_report.hpp"

using namespace rpyflow;

TEST(LogReportTest, GroupsInDiscoveryOrder)
{
  DiagnosticBag diags;
  diags.report_warning({"chapter_1/articy_chapter_1.rpy", "0x01", "label_0x01"}, "first");
  diags.report_note({}, "global note");
  diags.report_note({"articy_start.rpy", "0x02", "label_0x02"}, "second");
  diags.report_warning({"chapter_1/articy_chapter_1.rpy", "0x03", ""}, "third");

  LogReport log;
  log.add_all(diags);

  EXPECT_EQ(log.entry_count(), 4u);
  EXPECT_EQ(
    log.render(),
    "chapter_1/articy_chapter_1.rpy\n"
    "    label_0x01 first\n"
    "    third\n"
    "<global>\n"
    "    global note\n"
    "articy_start.rpy\n"
    "    label_0x02 second\n");
}

TEST(LogReportTest, EmptyLog)
{
  LogReport log;
  EXPECT_TRUE(log.empty());
  EXPECT_EQ(log.render(), "");
}
