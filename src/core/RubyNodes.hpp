#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Need full tree-sitter API for TSNode passed by value
extern "C" {
    #include <tree_sitter/api.h>
}

namespace obs_sitter {

/**
 * @brief Node kinds the signal visitor dispatches on
 *
 * Everything not listed explicitly falls into Other and is traversed
 * generically through its named children.
 */
enum class NodeKind {
    Class,     // class Foo < Bar ... end
    Module,    // module Foo ... end
    Call,      // receiver.method(args), include Foo, log(:info, "x")
    Sequence,  // program, body_statement, begin ... end
    Other
};

/**
 * @brief Helpers for reading tree-sitter-ruby nodes
 *
 * All text-returning helpers take the source the tree was parsed from.
 */
class RubyNodes {
public:
    static NodeKind classify(TSNode node);

    static std::string_view type(TSNode node);

    /**
     * @brief Child stored under a grammar field, or nullopt when absent
     */
    static std::optional<TSNode> field(TSNode node, std::string_view name);

    /**
     * @brief Named children in order, comments skipped
     */
    static std::vector<TSNode> named_children(TSNode node);

    static std::string text(TSNode node, std::string_view source);

    /**
     * @brief 1-based line of the node start
     */
    static uint32_t line(TSNode node);

    /**
     * @brief Full constant path of a constant or scope_resolution node
     *
     * Foo -> "Foo", Foo::Bar::Baz -> "Foo::Bar::Baz", ::Foo -> "Foo".
     * Returns nullopt for anything that is not a pure constant path.
     */
    static std::optional<std::string> constant_path(TSNode node, std::string_view source);

    /**
     * @brief Method name of a call node ("" when missing)
     */
    static std::string method_name(TSNode call, std::string_view source);

    /**
     * @brief Positional arguments of a call (keyword pairs, splats and block
     *        arguments excluded)
     */
    static std::vector<TSNode> positional_arguments(TSNode call);

    /**
     * @brief Value of a literal string (no interpolation) or literal symbol
     */
    static std::optional<std::string> literal_name(TSNode node, std::string_view source);

    /**
     * @brief Literal value of a plain symbol (:info, :"info")
     */
    static std::optional<std::string> symbol_value(TSNode node, std::string_view source);

    static bool is_string(TSNode node);

    /**
     * @brief True for a string node containing at least one #{...}
     */
    static bool is_interpolated_string(TSNode node);

    /**
     * @brief Literal fragments of a string node in source order
     *
     * Interpolations are dropped, not replaced.
     */
    static std::vector<std::string> string_fragments(TSNode node, std::string_view source);

    static bool is_variable(TSNode node);
};

} // namespace obs_sitter
