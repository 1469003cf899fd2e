#include "parser/analyzer_base.hpp"
#include "utils/safe_conversions.hpp"
#include <cstring>
#include <spdlog/spdlog.h>

namespace depgraph::parser {

namespace {

using TreePtr = std::unique_ptr<TSTree, void(*)(TSTree*)>;

} // namespace

bool TreeSitterAnalyzer::initialize() {
    if (!parser_) {
        spdlog::error("Parser not initialized");
        return false;
    }

    if (!ts_parser_set_language(parser_.get(), language())) {
        spdlog::error("Incompatible tree-sitter grammar for {}", get_language_name());
        return false;
    }
    spdlog::debug("Set up {} analyzer with tree-sitter", get_language_name());
    return true;
}

model::FileAnalysis TreeSitterAnalyzer::analyze(const ParserContext &context) {
    model::FileAnalysis result;

    if (context.file_content.empty()) {
        spdlog::debug("Empty file content: {}", context.file_path);
        return result;
    }

    try {
        TreePtr tree(ts_parser_parse_string(parser_.get(),
                                            nullptr,
                                            context.file_content.c_str(),
                                            utils::source_length(context.file_content)),
                     ts_tree_delete);
        if (!tree) {
            result.parse_error = "parser produced no tree";
            spdlog::warn("Parse failure in {}: {}", context.file_path, *result.parse_error);
            return result;
        }

        TSNode root = ts_tree_root_node(tree.get());
        std::vector<TSNode> top_level;
        // An ERROR root means recovery failed at the outermost level.
        uint32_t child_count = is_type(root, "ERROR") ? 0 : ts_node_named_child_count(root);
        for (uint32_t i = 0; i < child_count; ++i) {
            TSNode child = ts_node_named_child(root, i);
            if (ts_node_has_error(child)) {
                break;
            }
            top_level.push_back(child);
        }

        if (ts_node_has_error(root)) {
            TSNode error = find_first_error(root);
            size_t line = ts_node_is_null(error) ? 0 : line_of(error);
            result.parse_error = "syntax error at line " + std::to_string(line);
            spdlog::warn("Parse failure in {}: {}; keeping {} leading statement(s)",
                         context.file_path, *result.parse_error, top_level.size());
        }

        collect(top_level, context, result);
        spdlog::debug("{}: {} node(s), {} edge(s)", context.file_path, result.nodes.size(), result.edges.size());
    } catch (const std::exception &e) {
        spdlog::error("Error analyzing {}: {}", context.file_path, e.what());
        result.parse_error = e.what();
    }

    return result;
}

model::CodeNode TreeSitterAnalyzer::make_unit(TSNode definition,
                                              const std::string &name,
                                              model::NodeKind kind,
                                              const ParserContext &context) const {
    complexity::CyclomaticComplexity estimator(branch_rules());
    complexity::ComplexityResult metrics = estimator.calculate(definition);

    model::CodeNode node;
    node.id = model::make_node_id(context.module_name, name);
    node.name = name;
    node.kind = kind;
    node.language = get_language_name();
    node.path = context.file_path;
    node.line = line_of(definition);
    node.complexity = metrics.score;
    node.lines_of_code = metrics.lines_of_code;
    return node;
}

std::string TreeSitterAnalyzer::extract_node_text(TSNode node, const std::string &source_code) {
    if (ts_node_is_null(node)) {
        return "";
    }

    uint32_t start_byte = ts_node_start_byte(node);
    uint32_t end_byte = ts_node_end_byte(node);
    if (start_byte > end_byte || end_byte > source_code.length()) {
        return "";
    }
    return source_code.substr(start_byte, end_byte - start_byte);
}

TSNode TreeSitterAnalyzer::child_by_field(TSNode node, const char *field) {
    return ts_node_child_by_field_name(node, field, static_cast<uint32_t>(strlen(field)));
}

std::vector<TSNode> TreeSitterAnalyzer::children_by_field(TSNode node, const char *field) {
    std::vector<TSNode> children;

    TSTreeCursor cursor = ts_tree_cursor_new(node);
    if (ts_tree_cursor_goto_first_child(&cursor)) {
        do {
            const char *current_field = ts_tree_cursor_current_field_name(&cursor);
            if (current_field && strcmp(current_field, field) == 0) {
                children.push_back(ts_tree_cursor_current_node(&cursor));
            }
        } while (ts_tree_cursor_goto_next_sibling(&cursor));
    }
    ts_tree_cursor_delete(&cursor);

    return children;
}

size_t TreeSitterAnalyzer::line_of(TSNode node) {
    return static_cast<size_t>(ts_node_start_point(node).row) + 1;
}

bool TreeSitterAnalyzer::is_type(TSNode node, const char *type) {
    return !ts_node_is_null(node) && strcmp(ts_node_type(node), type) == 0;
}

// Descends through the first erroneous child at each level.
TSNode TreeSitterAnalyzer::find_first_error(TSNode node) {
    while (!ts_node_is_null(node)) {
        if (ts_node_is_missing(node) || strcmp(ts_node_type(node), "ERROR") == 0) {
            return node;
        }

        TSNode next{};
        uint32_t child_count = ts_node_child_count(node);
        for (uint32_t i = 0; i < child_count; ++i) {
            TSNode child = ts_node_child(node, i);
            if (ts_node_has_error(child)) {
                next = child;
                break;
            }
        }
        node = next;
    }
    return TSNode{};
}

} // namespace depgraph::parser
