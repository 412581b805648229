/**
 * @file filter_graph_test.cpp
 * @brief Pad bookkeeping, validation and serialization of FilterGraph
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include "reel_cutter/filter_graph.hpp"

namespace reel_cutter {
namespace {

FilterNode node(const std::string &filter, FilterArgs args,
                std::vector<std::string> inputs,
                std::vector<std::string> outputs) {
  return FilterNode{filter, std::move(args), std::move(inputs),
                    std::move(outputs)};
}

TEST(FilterGraphTest, SerializesChainInInsertionOrder) {
  FilterGraph g;
  g.declare_input("0:v");
  g.add(node("scale", {{"w", "1080"}, {"h", "-2"}}, {"0:v"}, {"v1"}));
  g.add(node("setsar", {{"", "1"}}, {"v1"}, {"vout"}));
  g.mark_output("vout");

  EXPECT_NO_THROW(g.validate());
  EXPECT_EQ(g.serialize(), "[0:v]scale=w=1080:h=-2[v1];\n[v1]setsar=1[vout]");
  EXPECT_EQ(g.count("scale"), 1);
  EXPECT_EQ(g.count("overlay"), 0);
}

TEST(FilterGraphTest, DeclaredInputsMayBeReadRepeatedly) {
  FilterGraph g;
  g.declare_input("0:v");
  g.add(node("trim", {{"start", "0"}}, {"0:v"}, {"a"}));
  g.add(node("trim", {{"start", "5"}}, {"0:v"}, {"b"}));
  g.add(node("concat", {{"n", "2"}}, {"a", "b"}, {"out"}));
  g.mark_output("out");
  EXPECT_NO_THROW(g.validate());
}

TEST(FilterGraphTest, RejectsForwardReference) {
  FilterGraph g;
  EXPECT_THROW(g.add(node("setsar", {}, {"later"}, {"x"})), std::logic_error);
}

TEST(FilterGraphTest, RejectsDoubleConsumption) {
  FilterGraph g;
  g.declare_input("0:v");
  g.add(node("null", {}, {"0:v"}, {"v1"}));
  g.add(node("null", {}, {"v1"}, {"v2"}));
  EXPECT_THROW(g.add(node("null", {}, {"v1"}, {"v3"})), std::logic_error);
}

TEST(FilterGraphTest, RejectsDuplicateOutputLabel) {
  FilterGraph g;
  g.declare_input("0:v");
  g.add(node("null", {}, {"0:v"}, {"v1"}));
  EXPECT_THROW(g.add(node("null", {}, {"0:v"}, {"v1"})), std::logic_error);
  EXPECT_THROW(g.add(node("null", {}, {"v1"}, {"0:v"})), std::logic_error);
}

TEST(FilterGraphTest, ValidateFindsDanglingPads) {
  FilterGraph g;
  g.declare_input("0:v");
  g.add(node("split", {}, {"0:v"}, {"a", "b"}));
  g.mark_output("a");
  EXPECT_THROW(g.validate(), std::logic_error);

  FilterGraph h;
  h.declare_input("0:v");
  h.add(node("null", {}, {"0:v"}, {"v1"}));
  h.mark_output("missing");
  EXPECT_THROW(h.validate(), std::logic_error);
}

TEST(FilterGraphTest, EscapesOptionAndGraphLevels) {
  EXPECT_EQ(escape_option_value("a:b"), "a\\:b");
  EXPECT_EQ(escape_option_value("it's"), "it\\'s");
  EXPECT_EQ(escape_graph_text("x,y;[z]"), "x\\,y\\;\\[z\\]");

  FilterGraph g;
  g.declare_input("0:v");
  g.add(node("drawtext", {{"text", "Hi: there, you"}}, {"0:v"}, {"out"}));
  g.mark_output("out");
  EXPECT_EQ(g.serialize(), "[0:v]drawtext=text=Hi\\\\: there\\, you[out]");
}

TEST(FilterGraphTest, EqualityComparesStructure) {
  auto build = [](const std::string &w) {
    FilterGraph g;
    g.declare_input("0:v");
    g.add(node("scale", {{"w", w}}, {"0:v"}, {"out"}));
    g.mark_output("out");
    return g;
  };
  EXPECT_TRUE(build("720") == build("720"));
  EXPECT_FALSE(build("720") == build("1080"));
}

} // anonymous namespace
} // namespace reel_cutter
