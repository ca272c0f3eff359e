#include "core/RubyNodes.hpp"
#include "core/SourceParser.hpp"

namespace obs_sitter {

NodeKind RubyNodes::classify(TSNode node) {
    std::string_view node_type = type(node);

    if (node_type == "class") {
        return NodeKind::Class;
    }
    if (node_type == "module") {
        return NodeKind::Module;
    }
    if (node_type == "call") {
        return NodeKind::Call;
    }
    if (node_type == "program" || node_type == "body_statement" ||
        node_type == "begin" || node_type == "parenthesized_statements") {
        return NodeKind::Sequence;
    }
    return NodeKind::Other;
}

std::string_view RubyNodes::type(TSNode node) {
    if (ts_node_is_null(node)) {
        return {};
    }
    return ts_node_type(node);
}

std::optional<TSNode> RubyNodes::field(TSNode node, std::string_view name) {
    TSNode child = ts_node_child_by_field_name(
        node, name.data(), static_cast<uint32_t>(name.size()));
    if (ts_node_is_null(child)) {
        return std::nullopt;
    }
    return child;
}

std::vector<TSNode> RubyNodes::named_children(TSNode node) {
    std::vector<TSNode> children;
    uint32_t count = ts_node_named_child_count(node);
    children.reserve(count);

    for (uint32_t i = 0; i < count; i++) {
        TSNode child = ts_node_named_child(node, i);
        if (type(child) == "comment") {
            continue;
        }
        children.push_back(child);
    }
    return children;
}

std::string RubyNodes::text(TSNode node, std::string_view source) {
    return SourceParser::node_text(node, source);
}

uint32_t RubyNodes::line(TSNode node) {
    return ts_node_start_point(node).row + 1;
}

std::optional<std::string> RubyNodes::constant_path(TSNode node, std::string_view source) {
    if (ts_node_is_null(node)) {
        return std::nullopt;
    }

    std::string_view node_type = type(node);

    if (node_type == "constant") {
        return text(node, source);
    }

    if (node_type == "scope_resolution") {
        auto name = field(node, "name");
        if (!name || type(*name) != "constant") {
            return std::nullopt;
        }

        auto scope = field(node, "scope");
        if (!scope) {
            // ::Foo
            return text(*name, source);
        }

        auto scope_path = constant_path(*scope, source);
        if (!scope_path) {
            return std::nullopt;
        }
        return *scope_path + "::" + text(*name, source);
    }

    return std::nullopt;
}

std::string RubyNodes::method_name(TSNode call, std::string_view source) {
    auto method = field(call, "method");
    if (!method) {
        return "";
    }
    return text(*method, source);
}

std::vector<TSNode> RubyNodes::positional_arguments(TSNode call) {
    std::vector<TSNode> args;

    auto arguments = field(call, "arguments");
    if (!arguments) {
        return args;
    }

    for (TSNode arg : named_children(*arguments)) {
        std::string_view arg_type = type(arg);
        if (arg_type == "pair" || arg_type == "block_argument" ||
            arg_type == "hash_splat_argument" || arg_type == "splat_argument") {
            continue;
        }
        args.push_back(arg);
    }
    return args;
}

std::optional<std::string> RubyNodes::literal_name(TSNode node, std::string_view source) {
    if (is_string(node)) {
        if (is_interpolated_string(node)) {
            return std::nullopt;
        }
        std::string value;
        for (const auto& fragment : string_fragments(node, source)) {
            value += fragment;
        }
        return value;
    }
    return symbol_value(node, source);
}

std::optional<std::string> RubyNodes::symbol_value(TSNode node, std::string_view source) {
    std::string_view node_type = type(node);

    if (node_type == "simple_symbol" || node_type == "symbol") {
        std::string value = text(node, source);
        if (!value.empty() && value.front() == ':') {
            value.erase(0, 1);
        }
        return value;
    }

    if (node_type == "delimited_symbol") {
        std::string value;
        for (TSNode child : named_children(node)) {
            std::string_view child_type = type(child);
            if (child_type == "interpolation") {
                return std::nullopt;
            }
            if (child_type == "string_content" || child_type == "escape_sequence") {
                value += text(child, source);
            }
        }
        return value;
    }

    return std::nullopt;
}

bool RubyNodes::is_string(TSNode node) {
    return type(node) == "string";
}

bool RubyNodes::is_interpolated_string(TSNode node) {
    if (!is_string(node)) {
        return false;
    }
    for (TSNode child : named_children(node)) {
        if (type(child) == "interpolation") {
            return true;
        }
    }
    return false;
}

std::vector<std::string> RubyNodes::string_fragments(TSNode node, std::string_view source) {
    std::vector<std::string> fragments;
    for (TSNode child : named_children(node)) {
        std::string_view child_type = type(child);
        if (child_type == "string_content" || child_type == "escape_sequence") {
            fragments.push_back(text(child, source));
        }
    }
    return fragments;
}

bool RubyNodes::is_variable(TSNode node) {
    std::string_view node_type = type(node);
    return node_type == "identifier" || node_type == "instance_variable" ||
           node_type == "class_variable" || node_type == "global_variable";
}

} // namespace obs_sitter
