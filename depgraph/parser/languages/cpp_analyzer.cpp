#include "cpp_analyzer.hpp"
#include <cstring>
#include <spdlog/spdlog.h>

namespace depgraph::parser::languages {

std::unique_ptr<LanguageAnalyzer> CppAnalyzer::clone() const {
    return std::make_unique<CppAnalyzer>();
}

std::vector<std::string> CppAnalyzer::get_extensions() const {
    return {"cpp", "cxx", "cc", "hpp", "hxx", "hh", "h"};
}

std::string CppAnalyzer::get_language_name() const {
    return "cpp";
}

const TSLanguage *CppAnalyzer::language() const {
    return tree_sitter_cpp();
}

const complexity::BranchRules &CppAnalyzer::branch_rules() const {
    return complexity::cpp_rules();
}

// Pre-order walk with an explicit stack; initializer lists and nested
// namespaces can be arbitrarily deep.
void CppAnalyzer::collect(const std::vector<TSNode> &top_level,
                          const ParserContext &context,
                          model::FileAnalysis &result) {
    std::vector<TSNode> stack(top_level.rbegin(), top_level.rend());
    std::vector<TSNode> children;

    while (!stack.empty()) {
        TSNode node = stack.back();
        stack.pop_back();
        if (ts_node_is_null(node)) {
            continue;
        }

        const char *type = ts_node_type(node);

        if (strcmp(type, "preproc_include") == 0) {
            add_include(node, context, result);
            continue;
        }

        if (strcmp(type, "function_definition") == 0) {
            // Function bodies hold no further units worth reporting.
            add_function(node, context, result);
            continue;
        }

        if (strcmp(type, "class_specifier") == 0 || strcmp(type, "struct_specifier") == 0) {
            add_class(node, context, result);
        }

        children.clear();
        uint32_t child_count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < child_count; i++) {
            children.push_back(ts_node_named_child(node, i));
        }
        stack.insert(stack.end(), children.rbegin(), children.rend());
    }
}

void CppAnalyzer::add_include(TSNode node, const ParserContext &context, model::FileAnalysis &result) {
    TSNode path = child_by_field(node, "path");
    std::string target = extract_node_text(path, context.file_content);

    // "local.h" and <system> both lose their delimiters.
    if (target.size() >= 2 &&
        ((target.front() == '"' && target.back() == '"') ||
         (target.front() == '<' && target.back() == '>'))) {
        target = target.substr(1, target.size() - 2);
    }
    if (target.empty()) {
        return;
    }

    model::CodeDependency edge;
    edge.source = context.module_name;
    edge.target = std::move(target);
    edge.kind = model::DependencyKind::imports;
    edge.line = line_of(node);
    result.edges.push_back(std::move(edge));
}

void CppAnalyzer::add_class(TSNode node, const ParserContext &context, model::FileAnalysis &result) {
    // Forward declarations and elaborated type uses have no body.
    if (ts_node_is_null(child_by_field(node, "body"))) {
        return;
    }

    TSNode name_node = unqualified_name(child_by_field(node, "name"));
    if (ts_node_is_null(name_node)) {
        return;
    }

    std::string name = extract_node_text(name_node, context.file_content);
    model::CodeNode class_node = make_unit(node, name, model::NodeKind::class_, context);
    spdlog::debug("Found C++ class: {} (line {})", name, class_node.line);

    uint32_t child_count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < child_count; i++) {
        TSNode clause = ts_node_named_child(node, i);
        if (!is_type(clause, "base_class_clause")) {
            continue;
        }

        uint32_t base_count = ts_node_named_child_count(clause);
        for (uint32_t j = 0; j < base_count; j++) {
            TSNode base = ts_node_named_child(clause, j);
            if (!is_type(base, "type_identifier")) {
                continue;
            }

            std::string base_name = extract_node_text(base, context.file_content);
            model::CodeDependency edge;
            edge.source = class_node.id;
            edge.target = base_name;
            edge.kind = model::DependencyKind::inherits;
            edge.line = class_node.line;
            result.edges.push_back(std::move(edge));
            class_node.dependency_refs.push_back(base_name);
        }
    }

    result.nodes.push_back(std::move(class_node));
}

void CppAnalyzer::add_function(TSNode node, const ParserContext &context, model::FileAnalysis &result) {
    TSNode name_node = find_function_name(child_by_field(node, "declarator"));
    if (ts_node_is_null(name_node)) {
        spdlog::debug("Skipping C++ function without a recognisable name at line {}", line_of(node));
        return;
    }

    std::string name = extract_node_text(name_node, context.file_content);
    model::CodeNode function_node = make_unit(node, name, model::NodeKind::function, context);
    spdlog::debug("Found C++ function: {} (lines {}-{})",
                  name, function_node.line, function_node.line + function_node.lines_of_code - 1);
    result.nodes.push_back(std::move(function_node));
}

// Follows the declarator chain (pointer, reference, function declarators)
// down to the declared name.
TSNode CppAnalyzer::find_function_name(TSNode declarator) {
    while (!ts_node_is_null(declarator)) {
        const char *type = ts_node_type(declarator);

        if (strcmp(type, "identifier") == 0 ||
            strcmp(type, "field_identifier") == 0 ||
            strcmp(type, "destructor_name") == 0 ||
            strcmp(type, "operator_name") == 0) {
            return declarator;
        }

        if (strcmp(type, "qualified_identifier") == 0 ||
            strcmp(type, "template_function") == 0) {
            return unqualified_name(declarator);
        }

        declarator = child_by_field(declarator, "declarator");
    }
    return TSNode{};
}

TSNode CppAnalyzer::unqualified_name(TSNode name) {
    while (!ts_node_is_null(name) &&
           (is_type(name, "qualified_identifier") ||
            is_type(name, "template_type") ||
            is_type(name, "template_function"))) {
        name = child_by_field(name, "name");
    }
    return name;
}

} // namespace depgraph::parser::languages
