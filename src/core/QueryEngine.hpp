#pragma once

#include "core/SourceParser.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Need full tree-sitter API for TSNode in QueryCapture
extern "C" {
    #include <tree_sitter/api.h>
}

// Forward declarations for types not used inline
extern "C" {
    struct TSQuery;
    struct TSQueryCursor;
}

namespace obs_sitter {

/**
 * @brief A single captured node inside a query match
 */
struct QueryCapture {
    std::string name;   // Name of the capture (e.g., "target" for @target)
    TSNode node;        // The captured node
    std::string text;   // Text content of the captured node
};

/**
 * @brief All captures of one pattern match, in capture order
 */
struct QueryMatch {
    uint32_t pattern_index = 0;
    std::vector<QueryCapture> captures;

    /**
     * @brief First capture with the given name, or nullptr
     */
    const QueryCapture* find(std::string_view capture_name) const;
};

/**
 * @brief RAII wrapper for TSQuery from tree-sitter
 *
 * Manages the lifetime of a compiled tree-sitter query.
 */
class Query {
public:
    explicit Query(TSQuery* query);
    ~Query();

    // Delete copy operations
    Query(const Query&) = delete;
    Query& operator=(const Query&) = delete;

    // Move operations
    Query(Query&& other) noexcept;
    Query& operator=(Query&& other) noexcept;

    TSQuery* get() const { return query_; }

    uint32_t pattern_count() const;

    uint32_t capture_count() const;

    std::string capture_name(uint32_t index) const;

private:
    TSQuery* query_;
};

/**
 * @brief Engine for executing tree-sitter queries on Ruby syntax trees
 *
 * Text predicates (#eq?, #any-of?) are not evaluated here; callers filter
 * the returned captures themselves.
 */
class QueryEngine {
public:
    /**
     * @brief Compile a tree-sitter query from S-expression syntax
     * @param query_string S-expression query string
     * @return Unique pointer to compiled query, or nullptr on error
     */
    std::unique_ptr<Query> compile_query(std::string_view query_string);

    /**
     * @brief Execute a query on a syntax tree
     * @param tree The parsed syntax tree
     * @param query The compiled query
     * @param source The source code (for extracting text)
     * @return One entry per pattern match, in document order
     */
    std::vector<QueryMatch> execute(
        const Tree& tree,
        const Query& query,
        std::string_view source
    );

    struct PredefinedQueries {
        // Constant assignments whose value is Client.factory("name", ...)
        static constexpr std::string_view METRIC_CONSTANT_DEFINITIONS =
            "(assignment"
            "  left: [(constant) (scope_resolution)] @target"
            "  right: (call"
            "    receiver: [(constant) (scope_resolution)] @client"
            "    method: (identifier) @factory"
            "    arguments: (argument_list . [(string) (simple_symbol) (delimited_symbol)] @name)"
            "  )"
            ") @definition";
    };
};

} // namespace obs_sitter
