// test_branch_resolver.cpp - Jump and menu emission

#include <gtest/gtest.h>

#include "rpyflow/basic/errors.hpp"
#include "rpyflow/compiler/branch_resolver.hpp"
#include "test_support/graph_builder.hpp"

using namespace rpyflow;
using rpyflow::test::GraphBuilder;
using rpyflow::test::make_config;

namespace
{

struct Fixture
{
  explicit Fixture(FlowGraph g, ProjectConfig c = make_config())
  : graph(std::move(g)), config(std::move(c)), session(graph, config, diags), branches(session)
  {
  }

  script::Block emit(const std::string & node_id)
  {
    const Node * node = graph.find_node(node_id);
    script::Block block;
    branches.emit(*node, BranchResolver::outgoing_pin(*node), block, 1);
    return block;
  }

  FlowGraph graph;
  ProjectConfig config;
  DiagnosticBag diags;
  CompileSession session;
  BranchResolver branches;
};

std::vector<std::string> texts(const script::Block & block)
{
  std::vector<std::string> out;
  for (const auto & line : block.lines) {
    out.push_back(line.jump_node ? "-> " + *line.jump_node : line.text);
  }
  return out;
}

}  // namespace

TEST(BranchResolverTest, SingleTargetIsPlainJump)
{
  Fixture f(GraphBuilder().dialogue("a", "", "A").dialogue("b", "", "B").connect("a", "b").build());

  const script::Block block = f.emit("a");
  EXPECT_EQ(texts(block), std::vector<std::string>{"-> b"});
  EXPECT_EQ(block.jump_targets, std::vector<std::string>{"b"});
  EXPECT_TRUE(f.diags.empty());
}

TEST(BranchResolverTest, NoTargetJumpsToEndWithDiagnostic)
{
  Fixture f(GraphBuilder().dialogue("a", "", "A").build());

  const script::Block block = f.emit("a");
  EXPECT_EQ(texts(block), std::vector<std::string>{"jump end"});
  ASSERT_EQ(f.diags.size(), 1u);
  EXPECT_EQ(f.diags.all()[0].code, "W001");
  EXPECT_EQ(
    f.diags.all()[0].message, "was not assigned any jump target in Articy, will jump to \"end\"");
  EXPECT_EQ(f.diags.all()[0].location.label, "label_a");
}

TEST(BranchResolverTest, OutputPinInstructionsComeFirst)
{
  GraphBuilder b;
  b.dialogue("a", "", "A").dialogue("b", "", "B").connect("a", "b");
  b.node("a").output_pins[0].text = "Story.coins = Story.coins + 1; Story.met = true";
  Fixture f(b.build());

  EXPECT_EQ(
    texts(f.emit("a")),
    (std::vector<std::string>{"$ Story.coins = Story.coins + 1", "$ Story.met = True", "-> b"}));
}

TEST(BranchResolverTest, MenuOrderedByChoiceIndexThenDiscovery)
{
  const FlowGraph graph = GraphBuilder()
                            .add(NodeKind::Hub, "h")
                            .dialogue("a", "", "A text")
                            .menu_text("Go left")
                            .dialogue("b", "", "B text")
                            .directions("1")
                            .add(NodeKind::Hub, "c")
                            .connect("h", "a")
                            .connect("h", "b")
                            .connect("h", "c", "Wait here")
                            .build();
  Fixture f(graph);

  EXPECT_EQ(
    texts(f.emit("h")), (std::vector<std::string>{
                          "menu:", "extend \"\"", "\"B text\":", "-> b", "\"Go left\":", "-> a",
                          "\"Wait here\":", "-> c"}));

  const script::Block block = f.emit("h");
  EXPECT_EQ(block.lines[0].indent, 1);
  EXPECT_EQ(block.lines[1].indent, 2);
  EXPECT_EQ(block.lines[3].indent, 3);
}

TEST(BranchResolverTest, EqualChoiceIndexKeepsDiscoveryOrder)
{
  const FlowGraph graph = GraphBuilder()
                            .add(NodeKind::Hub, "h")
                            .directions("display_text_box=false")
                            .dialogue("x", "", "X")
                            .directions("2")
                            .dialogue("y", "", "Y")
                            .directions("2")
                            .dialogue("z", "", "Z")
                            .directions("1")
                            .connect("h", "x")
                            .connect("h", "y")
                            .connect("h", "z")
                            .build();
  Fixture f(graph);

  EXPECT_EQ(
    texts(f.emit("h")), (std::vector<std::string>{
                          "menu:", "\"Z\":", "-> z", "\"X\":", "-> x", "\"Y\":", "-> y"}));
}

TEST(BranchResolverTest, ChoiceConditionFromTargetInputPin)
{
  const FlowGraph graph = GraphBuilder()
                            .add(NodeKind::Hub, "h")
                            .directions("display_text_box=no")
                            .dialogue("a", "", "Pay")
                            .condition("Story.coins > 2 && !Story.broke")
                            .dialogue("b", "", "Leave")
                            .connect("h", "a")
                            .connect("h", "b")
                            .build();
  Fixture f(graph);

  EXPECT_EQ(
    texts(f.emit("h")), (std::vector<std::string>{
                          "menu:", "\"Pay\" if Story.coins > 2 and not Story.broke:", "-> a",
                          "\"Leave\":", "-> b"}));
}

TEST(BranchResolverTest, MenuTextBeatsLabelBeatsText)
{
  const FlowGraph graph = GraphBuilder()
                            .add(NodeKind::Hub, "h")
                            .dialogue("a", "", "Primary text")
                            .menu_text("Menu text")
                            .dialogue("b", "", "Other")
                            .connect("h", "a", "Connection label")
                            .connect("h", "b", "Label wins")
                            .build();
  Fixture f(graph);

  const auto lines = texts(f.emit("h"));
  ASSERT_GE(lines.size(), 6u);
  EXPECT_EQ(lines[2], "\"Menu text\":");
  EXPECT_EQ(lines[4], "\"Label wins\":");
}

TEST(BranchResolverTest, ChoiceWithoutAnyTextIsFatal)
{
  const FlowGraph graph = GraphBuilder()
                            .add(NodeKind::Hub, "h")
                            .add(NodeKind::Hub, "silent")
                            .dialogue("b", "", "B")
                            .connect("h", "silent")
                            .connect("h", "b")
                            .build();
  Fixture f(graph);

  try {
    (void)f.emit("h");
    FAIL() << "expected CompileError";
  } catch (const CompileError & e) {
    EXPECT_EQ(e.node_id(), "silent");
  }
}

TEST(BranchResolverTest, DuplicateConnectionsCollapse)
{
  Fixture f(GraphBuilder()
              .add(NodeKind::Hub, "h")
              .dialogue("a", "", "A")
              .connect("h", "a", "one")
              .connect("h", "a", "two")
              .build());

  EXPECT_EQ(texts(f.emit("h")), std::vector<std::string>{"-> a"});
}

TEST(BranchResolverTest, FollowsContainerOutputPins)
{
  const FlowGraph graph = GraphBuilder()
                            .container("c", "Scene")
                            .dialogue("inner", "c", "Inside")
                            .dialogue("next", "", "After")
                            .enter("c", "inner")
                            .exit("inner", "c")
                            .connect("c", "next")
                            .build();
  Fixture f(graph);

  const Node * inner = graph.find_node("inner");
  const auto target = f.branches.resolve_target(inner->output_pins[0].connections[0]);
  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->node_id, "next");

  // A container with content continues inside.
  EXPECT_EQ(texts(f.emit("c")), std::vector<std::string>{"-> inner"});
}

TEST(BranchResolverTest, OutputPinLoopResolvesToNothing)
{
  GraphBuilder b;
  b.container("c", "Scene").dialogue("inner", "c", "Inside").exit("inner", "c");
  b.node("c").output_pins[0].connections.push_back(Connection{"", "c", "c_out"});
  Fixture f(b.build());

  const Node * inner = f.graph.find_node("inner");
  EXPECT_FALSE(f.branches.resolve_target(inner->output_pins[0].connections[0]).has_value());
}

TEST(BranchResolverTest, UnknownPinFallsBackToTargetNode)
{
  GraphBuilder b;
  b.dialogue("a", "", "A");
  b.node("a").output_pins[0].connections.push_back(Connection{"", "ghost", "ghost_in"});
  Fixture f(b.build());

  EXPECT_EQ(texts(f.emit("a")), std::vector<std::string>{"-> ghost"});
}
