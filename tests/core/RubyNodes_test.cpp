#include <gtest/gtest.h>
#include "core/RubyNodes.hpp"
#include "core/SourceParser.hpp"

using namespace obs_sitter;

namespace {

// First named child of the program node
TSNode first_statement(const Tree& tree) {
    return ts_node_named_child(tree.root_node(), 0);
}

} // namespace

// Test 1: Classify - dispatch kinds for the handled node types
TEST(RubyNodesTest, Classify) {
    SourceParser parser;
    std::string source = "class A; end\nmodule B; end\nfoo.bar(1)\nx = 1\n";

    auto tree = parser.parse(source);
    ASSERT_NE(tree, nullptr);

    auto statements = RubyNodes::named_children(tree->root_node());
    ASSERT_EQ(statements.size(), 4u);

    EXPECT_EQ(RubyNodes::classify(tree->root_node()), NodeKind::Sequence);
    EXPECT_EQ(RubyNodes::classify(statements[0]), NodeKind::Class);
    EXPECT_EQ(RubyNodes::classify(statements[1]), NodeKind::Module);
    EXPECT_EQ(RubyNodes::classify(statements[2]), NodeKind::Call);
    EXPECT_EQ(RubyNodes::classify(statements[3]), NodeKind::Other);
}

// Test 2: ConstantPath - nested and top-level scope resolution
TEST(RubyNodesTest, ConstantPath) {
    SourceParser parser;
    std::string source = "Foo::Bar::Baz.call\n::Root.call\nvalue.call\n";

    auto tree = parser.parse(source);
    ASSERT_NE(tree, nullptr);

    auto statements = RubyNodes::named_children(tree->root_node());
    ASSERT_EQ(statements.size(), 3u);

    auto nested = RubyNodes::field(statements[0], "receiver");
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(RubyNodes::constant_path(*nested, source), "Foo::Bar::Baz");

    auto rooted = RubyNodes::field(statements[1], "receiver");
    ASSERT_TRUE(rooted.has_value());
    EXPECT_EQ(RubyNodes::constant_path(*rooted, source), "Root");

    auto variable = RubyNodes::field(statements[2], "receiver");
    ASSERT_TRUE(variable.has_value());
    EXPECT_FALSE(RubyNodes::constant_path(*variable, source).has_value());
    EXPECT_TRUE(RubyNodes::is_variable(*variable));
}

// Test 3: PositionalArguments - keyword pairs are not positional
TEST(RubyNodesTest, PositionalArguments) {
    SourceParser parser;
    std::string source = "StatsD.increment(\"jobs\", 2, tags: [\"a\"])";

    auto tree = parser.parse(source);
    ASSERT_NE(tree, nullptr);

    TSNode call = first_statement(*tree);
    EXPECT_EQ(RubyNodes::method_name(call, source), "increment");
    EXPECT_EQ(RubyNodes::line(call), 1u);

    auto args = RubyNodes::positional_arguments(call);
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(RubyNodes::literal_name(args[0], source), "jobs");
    EXPECT_FALSE(RubyNodes::literal_name(args[1], source).has_value());
}

// Test 4: LiteralNames - strings and symbols, interpolation rejected
TEST(RubyNodesTest, LiteralNames) {
    SourceParser parser;
    std::string source = "f(:plain, :\"quoted\", 'single', \"a#{b}c\")";

    auto tree = parser.parse(source);
    ASSERT_NE(tree, nullptr);

    auto args = RubyNodes::positional_arguments(first_statement(*tree));
    ASSERT_EQ(args.size(), 4u);

    EXPECT_EQ(RubyNodes::literal_name(args[0], source), "plain");
    EXPECT_EQ(RubyNodes::literal_name(args[1], source), "quoted");
    EXPECT_EQ(RubyNodes::literal_name(args[2], source), "single");
    EXPECT_FALSE(RubyNodes::literal_name(args[3], source).has_value());
}

// Test 5: StringFragments - interpolations are dropped, literals kept in order
TEST(RubyNodesTest, StringFragments) {
    SourceParser parser;
    std::string source = "f(\"Order #{id} shipped\")";

    auto tree = parser.parse(source);
    ASSERT_NE(tree, nullptr);

    auto args = RubyNodes::positional_arguments(first_statement(*tree));
    ASSERT_EQ(args.size(), 1u);

    EXPECT_TRUE(RubyNodes::is_string(args[0]));
    EXPECT_TRUE(RubyNodes::is_interpolated_string(args[0]));

    auto fragments = RubyNodes::string_fragments(args[0], source);
    ASSERT_EQ(fragments.size(), 2u);
    EXPECT_EQ(fragments[0], "Order ");
    EXPECT_EQ(fragments[1], " shipped");
}

// Test 6: MissingField - absent grammar fields give nullopt
TEST(RubyNodesTest, MissingField) {
    SourceParser parser;
    std::string source = "class Plain\nend\n";

    auto tree = parser.parse(source);
    ASSERT_NE(tree, nullptr);

    TSNode definition = first_statement(*tree);
    EXPECT_TRUE(RubyNodes::field(definition, "name").has_value());
    EXPECT_FALSE(RubyNodes::field(definition, "superclass").has_value());
}
