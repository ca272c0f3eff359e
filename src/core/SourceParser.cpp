#include "core/SourceParser.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

// Tree-sitter C API
extern "C" {
    #include <tree_sitter/api.h>

    const TSLanguage* tree_sitter_ruby();
}

namespace obs_sitter {

const TSLanguage* ruby_language() {
    return tree_sitter_ruby();
}

// ============================================================================
// Tree implementation
// ============================================================================

Tree::Tree(TSTree* tree) : tree_(tree) {
    if (!tree_) {
        throw std::invalid_argument("Cannot create Tree with nullptr");
    }
}

Tree::~Tree() {
    if (tree_) {
        ts_tree_delete(tree_);
    }
}

Tree::Tree(Tree&& other) noexcept : tree_(other.tree_) {
    other.tree_ = nullptr;
}

Tree& Tree::operator=(Tree&& other) noexcept {
    if (this != &other) {
        if (tree_) {
            ts_tree_delete(tree_);
        }
        tree_ = other.tree_;
        other.tree_ = nullptr;
    }
    return *this;
}

TSNode Tree::root_node() const {
    return ts_tree_root_node(tree_);
}

bool Tree::has_error() const {
    return ts_node_has_error(root_node());
}

// ============================================================================
// SourceParser implementation
// ============================================================================

SourceParser::SourceParser() : parser_(nullptr) {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create TSParser");
    }

    const TSLanguage* ts_lang = ruby_language();
    if (!ts_lang) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Ruby grammar is not available");
    }

    if (!ts_parser_set_language(parser_, ts_lang)) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Failed to set Ruby grammar for parser "
                                 "(tree-sitter ABI version mismatch)");
    }

    spdlog::debug("SourceParser created for Ruby grammar");
}

SourceParser::~SourceParser() {
    if (parser_) {
        ts_parser_delete(parser_);
    }
}

SourceParser::SourceParser(SourceParser&& other) noexcept
    : parser_(other.parser_) {
    other.parser_ = nullptr;
}

SourceParser& SourceParser::operator=(SourceParser&& other) noexcept {
    if (this != &other) {
        if (parser_) {
            ts_parser_delete(parser_);
        }
        parser_ = other.parser_;
        other.parser_ = nullptr;
    }
    return *this;
}

std::unique_ptr<Tree> SourceParser::parse(std::string_view source, std::string_view path) {
    spdlog::debug("Parsing {} ({} bytes)", path, source.size());

    TSTree* raw_tree = ts_parser_parse_string(
        parser_,
        nullptr,  // old_tree
        source.data(),
        static_cast<uint32_t>(source.size())
    );

    if (!raw_tree) {
        spdlog::debug("Parser returned no tree for {}", path);
        return nullptr;
    }

    auto tree = std::make_unique<Tree>(raw_tree);

    if (tree->has_error()) {
        spdlog::debug("Syntax error in {}", path);
        return nullptr;
    }

    return tree;
}

std::string SourceParser::node_text(TSNode node, std::string_view source) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);

    if (start >= source.size() || end > source.size() || start >= end) {
        return "";
    }

    return std::string(source.substr(start, end - start));
}

} // namespace obs_sitter
