// test_script_serializer.cpp - Script model -> .rpy text

#include <gtest/gtest.h>

#include "rpyflow/codegen/script_serializer.hpp"

using namespace rpyflow;

TEST(ScriptSerializerTest, BlockIndentationAndBlankLines)
{
  script::Block block;
  block.label = "label_0x01";
  block.add(1, "# DialogueFragment");
  block.add(1, "if met:");
  block.add(2, "\"Hi\"");
  block.add(1, "");
  block.add(1, "jump end");

  EXPECT_EQ(
    ScriptSerializer::serialize_block(block),
    "label label_0x01:\n"
    "    # DialogueFragment\n"
    "    if met:\n"
    "        \"Hi\"\n"
    "\n"
    "    jump end\n");
}

TEST(ScriptSerializerTest, FileWithoutHeaderSeparatesBlocks)
{
  script::FileUnit unit;
  unit.directory = "chapter_1";
  unit.file_name = "articy_chapter_1.rpy";
  script::Block a;
  a.label = "a";
  a.add(1, "return");
  script::Block b;
  b.label = "b";
  b.add(1, "return");
  unit.blocks = {a, b};

  EXPECT_EQ(unit.relative_path(), "chapter_1/articy_chapter_1.rpy");
  EXPECT_EQ(
    ScriptSerializer::serialize(unit), "label a:\n    return\n\nlabel b:\n    return\n");
}

TEST(ScriptSerializerTest, OutputFilesInStableOrder)
{
  script::ScriptTree tree;
  tree.base.file_name = "articy_start.rpy";
  tree.variables_source = "init python in Story:\n    pass\n";
  tree.characters_source = "";
  script::FileUnit unit;
  unit.directory = "chapter_1";
  unit.file_name = "articy_chapter_1.rpy";
  tree.units.push_back(unit);

  const auto files = render_output_files(tree, FilesConfig{});
  ASSERT_EQ(files.size(), 4u);
  EXPECT_EQ(files[0].relative_path, "articy_start.rpy");
  EXPECT_EQ(files[1].relative_path, "articy_variables.rpy");
  EXPECT_EQ(files[1].content, tree.variables_source);
  EXPECT_EQ(files[2].relative_path, "articy_characters.rpy");
  EXPECT_EQ(files[3].relative_path, "chapter_1/articy_chapter_1.rpy");
}
