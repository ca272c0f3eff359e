#include <gtest/gtest.h>
#include "core/SourceParser.hpp"

extern "C" {
    #include <tree_sitter/api.h>
}

using namespace obs_sitter;

// Test 1: ParseSimpleClass - well-formed Ruby gives a tree rooted at program
TEST(SourceParserTest, ParseSimpleClass) {
    SourceParser parser;
    std::string source = R"(
class PaymentService
  def call
    logger.info("payment_processed")
  end
end
)";

    auto tree = parser.parse(source);

    ASSERT_NE(tree, nullptr) << "Parser should return a valid tree";
    EXPECT_FALSE(tree->has_error());

    TSNode root = tree->root_node();
    ASSERT_FALSE(ts_node_is_null(root));
    EXPECT_STREQ(ts_node_type(root), "program");
    EXPECT_EQ(ts_node_named_child_count(root), 1u);
}

// Test 2: EmptySourceIsNotAFailure - empty file parses to an empty program
TEST(SourceParserTest, EmptySourceIsNotAFailure) {
    SourceParser parser;

    auto tree = parser.parse("");

    ASSERT_NE(tree, nullptr) << "Empty source should still parse";
    EXPECT_EQ(ts_node_named_child_count(tree->root_node()), 0u);
}

// Test 3: SyntaxErrorReturnsNullptr - broken code is a parse failure
TEST(SourceParserTest, SyntaxErrorReturnsNullptr) {
    SourceParser parser;

    auto tree = parser.parse("class Foo\n  def bar(\nend\n", "broken.rb");

    EXPECT_EQ(tree, nullptr) << "Trees with error nodes are rejected";
}

// Test 4: NodeText - text of a node is sliced from the source
TEST(SourceParserTest, NodeText) {
    SourceParser parser;
    std::string source = "StatsD.increment(\"jobs.done\")";

    auto tree = parser.parse(source);
    ASSERT_NE(tree, nullptr);

    TSNode call = ts_node_named_child(tree->root_node(), 0);
    EXPECT_STREQ(ts_node_type(call), "call");
    EXPECT_EQ(SourceParser::node_text(call, source), source);
}

// Test 5: ParserIsReusable - one parser handles several sources in sequence
TEST(SourceParserTest, ParserIsReusable) {
    SourceParser parser;

    auto first = parser.parse("module A; end");
    auto broken = parser.parse("def (");
    auto second = parser.parse("module B; end");

    EXPECT_NE(first, nullptr);
    EXPECT_EQ(broken, nullptr);
    EXPECT_NE(second, nullptr);
}

// Test 6: TreeMove - moving a Tree transfers ownership
TEST(SourceParserTest, TreeMove) {
    SourceParser parser;
    auto tree = parser.parse("x = 1");
    ASSERT_NE(tree, nullptr);

    TSTree* raw = tree->get();
    Tree moved(std::move(*tree));

    EXPECT_EQ(moved.get(), raw);
    EXPECT_EQ(tree->get(), nullptr);
}
