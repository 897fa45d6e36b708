// test_project_config.cpp - rpyflow.yaml parsing

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "rpyflow/project/project_config.hpp"

using namespace rpyflow;
namespace fs = std::filesystem;

namespace
{

fs::path make_temp_dir(const std::string & prefix)
{
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = fs::temp_directory_path() / (prefix + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

}  // namespace

TEST(ProjectConfigTest, MinimalSettingsUseDefaults)
{
  const auto result = parse_project_config(
    "paths:\n"
    "  path_articy_json: export/project.json\n"
    "  path_target_dir: game/articy\n",
    "/work/novel");

  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & c = result.config;
  EXPECT_EQ(c.paths.articy_json, fs::path("/work/novel/export/project.json"));
  EXPECT_EQ(c.paths.target_dir, fs::path("/work/novel/game/articy"));
  EXPECT_FALSE(c.paths.game_dir.has_value());
  EXPECT_EQ(c.files.file_prefix, "articy_");
  EXPECT_EQ(c.files.prefixed(c.files.base_file_name), "articy_start.rpy");
  EXPECT_EQ(c.renpy.label_prefix, "label_");
  EXPECT_EQ(c.renpy.end_label, "end");
  EXPECT_TRUE(c.renpy.menu_display_text_box);
  EXPECT_FALSE(c.renpy.markdown_text_styles);
  ASSERT_EQ(c.renpy.beginnings_log_lines.size(), 2u);
  EXPECT_EQ(c.articy.renpy_box, std::vector<std::string>{"RenPyBox"});
}

TEST(ProjectConfigTest, AllSectionsAndListForms)
{
  const auto result = parse_project_config(
    "paths:\n"
    "  path_articy_json: /abs/export.json\n"
    "  path_target_dir: out\n"
    "  path_game_dir: ../game\n"
    "files:\n"
    "  file_prefix: gen_\n"
    "  log_file_name: report.txt\n"
    "renpy:\n"
    "  label_prefix: l_\n"
    "  start_node: '0x0100000000000001'\n"
    "  markdown_text_styles: true\n"
    "  beginnings_log_lines: '# todo,  # fixme ,'\n"
    "articy:\n"
    "  renpy_box: [RenPyBox, RenPyScene]\n",
    "/proj/settings");

  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & c = result.config;
  EXPECT_EQ(c.paths.articy_json, fs::path("/abs/export.json"));
  ASSERT_TRUE(c.paths.game_dir.has_value());
  EXPECT_EQ(*c.paths.game_dir, fs::path("/proj/game"));
  EXPECT_EQ(c.files.prefixed(c.files.log_file_name), "gen_report.txt");
  EXPECT_EQ(c.renpy.label_prefix, "l_");
  EXPECT_EQ(c.renpy.start_node, "0x0100000000000001");
  EXPECT_TRUE(c.renpy.markdown_text_styles);
  EXPECT_EQ(c.renpy.beginnings_log_lines, (std::vector<std::string>{"# todo", "# fixme"}));
  EXPECT_EQ(c.articy.renpy_box, (std::vector<std::string>{"RenPyBox", "RenPyScene"}));
}

TEST(ProjectConfigTest, MissingRequiredPathNamesTheKey)
{
  const auto result = parse_project_config("paths:\n  path_target_dir: out\n", "/p");
  ASSERT_FALSE(result.success);
  EXPECT_NE(result.error.find("path_articy_json"), std::string::npos) << result.error;

  const auto no_target = parse_project_config("paths:\n  path_articy_json: a.json\n", "/p");
  ASSERT_FALSE(no_target.success);
  EXPECT_NE(no_target.error.find("path_target_dir"), std::string::npos) << no_target.error;
}

TEST(ProjectConfigTest, RejectsBadValues)
{
  const std::string paths = "paths:\n  path_articy_json: a.json\n  path_target_dir: out\n";

  EXPECT_FALSE(parse_project_config(paths + "renpy:\n  markdown_text_styles: maybe\n", "/p").success);
  EXPECT_FALSE(parse_project_config(paths + "files:\n  file_prefix: ''\n", "/p").success);
  EXPECT_FALSE(parse_project_config(paths + "renpy:\n  end_label: start\n", "/p").success);
  EXPECT_FALSE(parse_project_config("paths: [unclosed\n", "/p").success);
  EXPECT_FALSE(parse_project_config("- just\n- a list\n", "/p").success);
}

TEST(ProjectConfigTest, SplitCommaList)
{
  EXPECT_EQ(split_comma_list(" a, b ,,c "), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(split_comma_list("").empty());
  EXPECT_TRUE(split_comma_list(" , ").empty());
}

TEST(ProjectConfigTest, LoadAndFindFromDisk)
{
  const fs::path root = make_temp_dir("rpyflow_config");
  const fs::path nested = root / "a" / "b";
  fs::create_directories(nested);
  {
    std::ofstream out(root / k_project_config_file_name);
    out << "paths:\n  path_articy_json: export.json\n  path_target_dir: game/articy\n";
  }

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename(), k_project_config_file_name);

  const auto result = load_project_config(*found);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.project_root, fs::absolute(root));
  EXPECT_EQ(result.config.paths.target_dir, (fs::absolute(root) / "game/articy").lexically_normal());

  EXPECT_FALSE(load_project_config(root / "missing.yaml").success);

  fs::remove_all(root);
}
