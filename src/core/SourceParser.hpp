#pragma once

#include <memory>
#include <string>
#include <string_view>

// Forward declarations for tree-sitter C API
extern "C" {
    struct TSParser;
    struct TSTree;
    struct TSNode;
    struct TSLanguage;
}

namespace obs_sitter {

/**
 * @brief Grammar used for every parse in this project
 */
const TSLanguage* ruby_language();

/**
 * @brief RAII wrapper for TSTree from tree-sitter
 *
 * Manages the lifetime of a TSTree object, ensuring proper cleanup.
 */
class Tree {
public:
    explicit Tree(TSTree* tree);
    ~Tree();

    // Delete copy operations
    Tree(const Tree&) = delete;
    Tree& operator=(const Tree&) = delete;

    // Move operations
    Tree(Tree&& other) noexcept;
    Tree& operator=(Tree&& other) noexcept;

    /**
     * @brief Get the root node of the syntax tree
     */
    TSNode root_node() const;

    /**
     * @brief Check if the tree has any syntax errors
     */
    bool has_error() const;

    TSTree* get() const { return tree_; }

private:
    TSTree* tree_;
};

/**
 * @brief RAII parser for Ruby source code using tree-sitter
 *
 * A tree containing error nodes is treated as a parse failure: callers get
 * nullptr and the file contributes nothing. Diagnostics stay at debug level,
 * reporting a skipped file is up to the caller.
 */
class SourceParser {
public:
    /**
     * @brief Construct a parser bound to the Ruby grammar
     * @throws std::runtime_error if parser creation fails or the grammar cannot be set
     */
    SourceParser();
    ~SourceParser();

    // Delete copy operations
    SourceParser(const SourceParser&) = delete;
    SourceParser& operator=(const SourceParser&) = delete;

    // Move operations
    SourceParser(SourceParser&& other) noexcept;
    SourceParser& operator=(SourceParser&& other) noexcept;

    /**
     * @brief Parse Ruby source code
     * @param source Source code to parse
     * @param path Path used only for diagnostics
     * @return Parsed tree, or nullptr on a syntax error
     */
    std::unique_ptr<Tree> parse(std::string_view source,
                                std::string_view path = "(source)");

    /**
     * @brief Extract text content of a syntax node
     * @param node The syntax node
     * @param source The source code string
     * @return Text content of the node
     */
    static std::string node_text(TSNode node, std::string_view source);

private:
    TSParser* parser_;
};

} // namespace obs_sitter
