// test_flow_compiler.cpp - Whole graph traversal, layout and jump resolution

#include <gtest/gtest.h>

#include "rpyflow/basic/errors.hpp"
#include "rpyflow/codegen/script_serializer.hpp"
#include "rpyflow/compiler/flow_compiler.hpp"
#include "test_support/graph_builder.hpp"

using namespace rpyflow;
using rpyflow::test::GraphBuilder;
using rpyflow::test::make_config;

namespace
{

struct Compiled
{
  script::ScriptTree tree;
  DiagnosticBag diags;
};

Compiled compile(const FlowGraph & graph, const ProjectConfig & config = make_config())
{
  Compiled out;
  CompileSession session(graph, config, out.diags);
  FlowCompiler compiler(session);
  out.tree = compiler.compile();
  return out;
}

size_t count_blocks(const script::ScriptTree & tree, const std::string & label)
{
  size_t n = 0;
  for (const auto & block : tree.base.blocks) {
    n += block.label == label ? 1 : 0;
  }
  for (const auto & unit : tree.units) {
    for (const auto & block : unit.blocks) {
      n += block.label == label ? 1 : 0;
    }
  }
  return n;
}

}  // namespace

TEST(FlowCompilerTest, DirectoryNames)
{
  Node n;
  n.id = "0x42";
  n.display_name = "Chapter 1: The Road/Home";
  EXPECT_EQ(container_directory_name(n), "chapter_1:_the_road_home");
  n.display_name = "";
  EXPECT_EQ(container_directory_name(n), "0x42");
  n.display_name = "..";
  EXPECT_EQ(container_directory_name(n), "0x42");
}

TEST(FlowCompilerTest, SingleDialogueInContainer)
{
  const FlowGraph graph = GraphBuilder()
                            .container("c1", "chapter_1")
                            .dialogue("d1", "c1", "Hello!")
                            .enter("c1", "d1")
                            .build();
  const Compiled out = compile(graph);

  EXPECT_EQ(
    ScriptSerializer::serialize(out.tree.base),
    "# Entry point of the game\n"
    "# Generated by rpyflow, changes will be overwritten\n"
    "\n"
    "label start:\n"
    "    jump label_c1\n"
    "\n"
    "label end:\n"
    "    return\n");

  ASSERT_EQ(out.tree.units.size(), 1u);
  EXPECT_EQ(out.tree.units[0].relative_path(), "chapter_1/articy_chapter_1.rpy");
  EXPECT_TRUE(out.tree.units[0].closed);
  EXPECT_EQ(
    ScriptSerializer::serialize(out.tree.units[0]),
    "label label_c1:\n"
    "    # FlowFragment\n"
    "    # chapter_1\n"
    "    jump label_d1\n"
    "\n"
    "label label_d1:\n"
    "    # DialogueFragment\n"
    "    \"Hello!\"\n"
    "    jump end\n");

  const auto dangling = out.diags.with_code("W001");
  ASSERT_EQ(dangling.size(), 1u);
  EXPECT_EQ(dangling[0].location.file, "chapter_1/articy_chapter_1.rpy");
  EXPECT_EQ(dangling[0].location.label, "label_d1");
  EXPECT_EQ(out.tree.top_level_directories, std::vector<std::string>{"chapter_1"});
}

TEST(FlowCompilerTest, SharedTargetCompiledOnce)
{
  const FlowGraph graph = GraphBuilder()
                            .container("c1", "Chapter")
                            .add(NodeKind::Hub, "h", "c1")
                            .dialogue("left", "c1", "Left")
                            .dialogue("right", "c1", "Right")
                            .dialogue("merge", "c1", "Together again")
                            .enter("c1", "h")
                            .connect("h", "left")
                            .connect("h", "right")
                            .connect("left", "merge")
                            .connect("right", "merge")
                            .build();
  const Compiled out = compile(graph);

  EXPECT_EQ(count_blocks(out.tree, "label_merge"), 1u);
  const std::string text = ScriptSerializer::serialize(out.tree.units[0]);
  EXPECT_NE(text.find("label label_left:\n    # DialogueFragment\n    \"Left\"\n    jump label_merge\n"),
            std::string::npos)
    << text;
  EXPECT_NE(text.find("label label_right:\n    # DialogueFragment\n    \"Right\"\n    jump label_merge\n"),
            std::string::npos)
    << text;
}

TEST(FlowCompilerTest, CyclesTerminate)
{
  const FlowGraph graph = GraphBuilder()
                            .container("c1", "Loop")
                            .dialogue("a", "c1", "A")
                            .dialogue("b", "c1", "B")
                            .enter("c1", "a")
                            .connect("a", "b")
                            .connect("b", "a")
                            .build();
  const Compiled out = compile(graph);

  EXPECT_EQ(count_blocks(out.tree, "label_a"), 1u);
  EXPECT_EQ(count_blocks(out.tree, "label_b"), 1u);
  const std::string text = ScriptSerializer::serialize(out.tree.units[0]);
  EXPECT_NE(text.find("\"B\"\n    jump label_a\n"), std::string::npos) << text;
  EXPECT_TRUE(out.diags.empty());
}

TEST(FlowCompilerTest, NestedContainersMirrorDirectories)
{
  const FlowGraph graph = GraphBuilder()
                            .container("c1", "Chapter 1")
                            .container("c2", "Part A", "c1")
                            .dialogue("d", "c2", "Deep")
                            .enter("c1", "c2")
                            .enter("c2", "d")
                            .build();
  const Compiled out = compile(graph);

  ASSERT_EQ(out.tree.units.size(), 2u);
  EXPECT_EQ(out.tree.units[0].relative_path(), "chapter_1/articy_chapter_1.rpy");
  EXPECT_EQ(out.tree.units[1].relative_path(), "chapter_1/part_a/articy_part_a.rpy");
  EXPECT_EQ(out.tree.units[1].blocks.size(), 2u);
  EXPECT_EQ(out.tree.top_level_directories, std::vector<std::string>{"chapter_1"});
}

TEST(FlowCompilerTest, TopLevelLeavesGoToBaseFile)
{
  const FlowGraph graph = GraphBuilder().dialogue("d", "", "Standalone").build();
  const Compiled out = compile(graph);

  EXPECT_TRUE(out.tree.units.empty());
  ASSERT_EQ(out.tree.base.blocks.size(), 3u);
  EXPECT_EQ(out.tree.base.blocks[0].label, "start");
  EXPECT_EQ(out.tree.base.blocks[1].label, "label_d");
  EXPECT_EQ(out.tree.base.blocks[2].label, "end");
  EXPECT_EQ(out.diags.with_code("W001")[0].location.file, "articy_start.rpy");
}

TEST(FlowCompilerTest, EmptyGraphStartsAtEnd)
{
  const Compiled out = compile(GraphBuilder().build());
  EXPECT_EQ(
    ScriptSerializer::serialize_block(out.tree.base.blocks[0]), "label start:\n    jump end\n");
}

TEST(FlowCompilerTest, ConfiguredStartNode)
{
  ProjectConfig config = make_config();
  config.renpy.start_node = "d2";
  const FlowGraph graph =
    GraphBuilder().dialogue("d1", "", "One").dialogue("d2", "", "Two").build();
  const Compiled out = compile(graph, config);
  EXPECT_EQ(
    ScriptSerializer::serialize_block(out.tree.base.blocks[0]),
    "label start:\n    jump label_d2\n");

  config.renpy.start_node = "missing";
  EXPECT_THROW((void)compile(graph, config), CompileError);
}

TEST(FlowCompilerTest, ClashingDirectoriesAreFatal)
{
  const FlowGraph graph =
    GraphBuilder().container("c1", "Chapter 1").container("c2", "chapter_1").build();
  try {
    (void)compile(graph);
    FAIL() << "expected CompileError";
  } catch (const CompileError & e) {
    EXPECT_EQ(e.node_id(), "c2");
    EXPECT_NE(std::string(e.what()).find("chapter_1"), std::string::npos);
  }
}

TEST(FlowCompilerTest, LabelClashWithReservedLabel)
{
  const FlowGraph graph = GraphBuilder().dialogue("d", "", "x").directions("label=end").build();
  EXPECT_THROW((void)compile(graph), CompileError);
}

TEST(FlowCompilerTest, UnsupportedAndCommentNodes)
{
  const FlowGraph graph = GraphBuilder()
                            .container("c1", "Chapter")
                            .add(NodeKind::Unsupported, "u", "c1")
                            .add(NodeKind::Comment, "note", "c1", "just a note")
                            .enter("c1", "u")
                            .build();
  const Compiled out = compile(graph);

  EXPECT_EQ(count_blocks(out.tree, "label_u"), 0u);
  EXPECT_EQ(count_blocks(out.tree, "label_note"), 0u);
  const auto unsupported = out.diags.with_code("W006");
  ASSERT_EQ(unsupported.size(), 1u);
  EXPECT_EQ(unsupported[0].message, "type \"Location\" of node u is not supported");

  // The container still points at the unsupported node, which has no label.
  const auto unresolved = out.diags.with_code("W008");
  ASSERT_EQ(unresolved.size(), 1u);
  EXPECT_EQ(unresolved[0].message, "jumps to unknown node u, will jump to \"end\"");
  EXPECT_EQ(unresolved[0].location.label, "label_c1");
}

TEST(FlowCompilerTest, CharactersAndVariablesAreRendered)
{
  const FlowGraph graph = GraphBuilder()
                            .entity("e1", "Anna")
                            .variable("Story", "met", "Boolean", "false")
                            .dialogue("d", "", "Hi", "e1")
                            .build();
  const Compiled out = compile(graph);

  EXPECT_EQ(out.tree.characters_source, "define character.anna = Character(\"Anna\")\n");
  EXPECT_EQ(out.tree.variables_source, "init python in Story:\n    met = False\n");
  const std::string base = ScriptSerializer::serialize(out.tree.base);
  EXPECT_NE(base.find("    character.anna \"Hi\"\n"), std::string::npos) << base;
}
