// test_text_renderer.cpp - Say text, raw code and expression rendering

#include <gtest/gtest.h>

#include "rpyflow/compiler/text_renderer.hpp"

using namespace rpyflow;

TEST(TextRendererTest, SplitLinesNormalizesLineEndings)
{
  EXPECT_EQ(split_lines("a\r\nb\nc"), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(split_lines("").empty());
  EXPECT_EQ(split_lines("a\n"), (std::vector<std::string>{"a", ""}));
}

TEST(TextRendererTest, ParagraphsSplitOnBlankLines)
{
  EXPECT_EQ(
    split_paragraphs("one\ntwo\n\n  \nthree\n"),
    (std::vector<std::string>{"one\ntwo", "three"}));
}

TEST(TextRendererTest, EscapeQuotesAndPercent)
{
  EXPECT_EQ(escape_text(R"(He said "it's 100%")"), R"(He said \"it\'s 100\%\")");
}

TEST(TextRendererTest, MarkdownEmphasis)
{
  EXPECT_EQ(apply_markdown("**bold** and *italic* and _under_"),
            "{b}bold{/b} and {i}italic{/i} and {u}under{/u}");
  EXPECT_EQ(apply_markdown("a ** b"), "a ** b");
  EXPECT_EQ(apply_markdown("keep [player_name] and [a_b_c] *x*"), "keep [player_name] and [a_b_c] {i}x{/i}");
}

TEST(TextRendererTest, MarkdownTagsNeverCross)
{
  EXPECT_EQ(apply_markdown("***wow***"), "{b}{i}wow{/i}{/b}");
  EXPECT_EQ(apply_markdown("**a *b** c*"), "**a {i}b** c{/i}");
  EXPECT_EQ(apply_markdown("*a _b* c_"), "*a {u}b* c{/u}");
  EXPECT_EQ(apply_markdown("**bold _and under_**"), "{b}bold {u}and under{/u}{/b}");
  EXPECT_EQ(apply_markdown("****"), "****");
}

TEST(TextRendererTest, BracePathInference)
{
  EXPECT_EQ(
    infer_brace_paths("show {bg.png} at left", "chapter_1/scene_2"),
    "show 'images/chapter_1/scene_2/bg.png' at left");
  EXPECT_EQ(
    infer_brace_paths("show {../../logo.png}", "chapter_1/scene_2"), "show 'images/logo.png'");
  EXPECT_EQ(infer_brace_paths("text {not_an_image}", "c"), "text {not_an_image}");
}

TEST(TextRendererTest, AssetReferencesAndMarkers)
{
  EXPECT_EQ(
    find_asset_references(R"(play music "audio/theme.ogg" fadein 1.0 'x')"),
    std::vector<std::string>{"audio/theme.ogg"});

  const std::vector<std::string> prefixes = {"# todo"};
  EXPECT_TRUE(is_marker_line("    # TODO: fix this", prefixes));
  EXPECT_FALSE(is_marker_line("show bg # todo", prefixes));
}

TEST(TextRendererTest, TranslateExpressions)
{
  EXPECT_EQ(translate_expression("a == true && !b"), "a == True and not b");
  EXPECT_EQ(translate_expression("x||y"), "x or y");
  EXPECT_EQ(translate_expression("x != 3"), "x != 3");
  EXPECT_EQ(translate_expression("untrue == false\n"), "untrue == False");
  EXPECT_EQ(
    split_instructions("Story.coins = 3;\nStory.met = true;"),
    (std::vector<std::string>{"Story.coins = 3", "Story.met = True"}));
}

TEST(TextRendererTest, SayTextParagraphsAndLineBreaks)
{
  DiagnosticBag diags;
  const TextRenderer renderer(nullptr, {}, diags);

  EXPECT_EQ(
    renderer.render_say_text("Hello\nthere\n\n*Bye*", true),
    (std::vector<std::string>{"Hello\\nthere", "{i}Bye{/i}"}));
  EXPECT_TRUE(renderer.render_say_text("  \n", false).empty());
  EXPECT_EQ(renderer.render_choice_text("Go\n north", false), "Go north");
}

TEST(TextRendererTest, CodeLinesReportMissingAssetsAndMarkers)
{
  DiagnosticBag diags;
  AssetIndex assets;
  assets.add("images/chapter_1/bg.png");
  const TextRenderer renderer(&assets, {"# todo"}, diags);

  CodeContext ctx;
  ctx.container_path = "chapter_1";
  ctx.relative_imgs_in_braces = true;

  const auto lines = renderer.render_code_lines(
    "scene {bg.png}\n\nshow {missing.png}\n# TODO: music\n", ctx,
    DiagnosticLocation{"chapter_1/articy_chapter_1.rpy", "0x05", "label_0x05"});

  EXPECT_EQ(
    lines, (std::vector<std::string>{
             "scene 'images/chapter_1/bg.png'", "show 'images/chapter_1/missing.png'",
             "# TODO: music"}));
  ASSERT_EQ(diags.size(), 2u);
  EXPECT_EQ(diags.all()[0].code, "W003");
  EXPECT_EQ(
    diags.all()[0].message, "references non-existent file \"images/chapter_1/missing.png\"");
  EXPECT_EQ(diags.all()[1].code, "N002");
  EXPECT_EQ(diags.all()[1].message, "contains the following line: # TODO: music");
  EXPECT_EQ(diags.all()[1].location.label, "label_0x05");
}

TEST(TextRendererTest, NoAssetIndexDisablesChecks)
{
  DiagnosticBag diags;
  const TextRenderer renderer(nullptr, {}, diags);
  const auto lines = renderer.render_code_lines("show 'ghost.png'", CodeContext{}, {});
  EXPECT_EQ(lines.size(), 1u);
  EXPECT_TRUE(diags.empty());
}
