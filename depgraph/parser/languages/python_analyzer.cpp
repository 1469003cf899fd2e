#include "python_analyzer.hpp"
#include <cstring>
#include <deque>
#include <iterator>
#include <spdlog/spdlog.h>
#include <utility>

namespace depgraph::parser::languages {

namespace {

bool has_type(TSNode node, const char *type) {
    return strcmp(ts_node_type(node), type) == 0;
}

// Wrappers with no node of their own in Python's syntax tree. Their
// children belong to the enclosing level.
bool is_transparent(TSNode node) {
    return has_type(node, "block") ||
           has_type(node, "else_clause") ||
           has_type(node, "finally_clause") ||
           has_type(node, "with_clause");
}

} // namespace

void PythonAnalyzer::push_spliced(TSNode node, std::deque<Visit> &queue) {
    std::vector<TSNode> stack{node};
    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();
        if (!is_transparent(current)) {
            queue.push_back(Visit{current, {}});
            continue;
        }

        uint32_t count = ts_node_named_child_count(current);
        for (uint32_t i = count; i > 0; --i) {
            stack.push_back(ts_node_named_child(current, i - 1));
        }
    }
}

// An if statement owns only its first alternative. Each further elif or
// else hangs off the elif before it, as in `if/else: if` nesting.
void PythonAnalyzer::enqueue_children(const Visit &visit, std::deque<Visit> &queue) {
    const bool is_if = has_type(visit.node, "if_statement");
    std::vector<TSNode> alternatives = visit.later_alternatives;

    uint32_t count = ts_node_named_child_count(visit.node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(visit.node, i);
        if (is_if && (has_type(child, "elif_clause") || has_type(child, "else_clause"))) {
            alternatives.push_back(child);
        } else {
            push_spliced(child, queue);
        }
    }

    if (alternatives.empty()) {
        return;
    }
    TSNode first = alternatives.front();
    if (has_type(first, "elif_clause")) {
        queue.push_back(Visit{first, std::vector<TSNode>(alternatives.begin() + 1, alternatives.end())});
    } else {
        push_spliced(first, queue);
    }
}

std::unique_ptr<LanguageAnalyzer> PythonAnalyzer::clone() const {
    return std::make_unique<PythonAnalyzer>();
}

std::vector<std::string> PythonAnalyzer::get_extensions() const {
    return {"py"};
}

std::string PythonAnalyzer::get_language_name() const {
    return "python";
}

const TSLanguage *PythonAnalyzer::language() const {
    return tree_sitter_python();
}

const complexity::BranchRules &PythonAnalyzer::branch_rules() const {
    return complexity::python_rules();
}

void PythonAnalyzer::collect(const std::vector<TSNode> &top_level,
                             const ParserContext &context,
                             model::FileAnalysis &result) {
    std::vector<model::CodeDependency> imports;
    std::deque<Visit> queue;
    for (TSNode node : top_level) {
        queue.push_back(Visit{node, {}});
    }

    while (!queue.empty()) {
        Visit visit = std::move(queue.front());
        queue.pop_front();

        // Decorators do not add a level: the definition takes the place of
        // its decorated_definition wrapper.
        if (is_type(visit.node, "decorated_definition")) {
            TSNode definition = child_by_field(visit.node, "definition");
            if (ts_node_is_null(definition)) {
                continue;
            }
            visit.node = definition;
        }

        const char *type = ts_node_type(visit.node);
        if (strcmp(type, "class_definition") == 0) {
            add_class(visit.node, context, result);
        } else if (strcmp(type, "function_definition") == 0) {
            add_function(visit.node, context, result);
        } else if (strcmp(type, "import_statement") == 0 ||
                   strcmp(type, "import_from_statement") == 0 ||
                   strcmp(type, "future_import_statement") == 0) {
            collect_imports(visit.node, context, imports);
            continue;
        }

        enqueue_children(visit, queue);
    }

    result.edges.insert(result.edges.end(),
                        std::make_move_iterator(imports.begin()),
                        std::make_move_iterator(imports.end()));
}

void PythonAnalyzer::add_class(TSNode node, const ParserContext &context, model::FileAnalysis &result) {
    TSNode name_node = child_by_field(node, "name");
    if (ts_node_is_null(name_node)) {
        return;
    }

    std::string name = extract_node_text(name_node, context.file_content);
    model::CodeNode class_node = make_unit(node, name, model::NodeKind::class_, context);
    spdlog::debug("Found Python class: {} (line {})", name, class_node.line);

    TSNode superclasses = child_by_field(node, "superclasses");
    if (!ts_node_is_null(superclasses)) {
        uint32_t count = ts_node_named_child_count(superclasses);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode base = ts_node_named_child(superclasses, i);
            // Attribute bases (a.B), calls and keyword arguments such as
            // metaclass= are not plain names.
            if (!is_type(base, "identifier")) {
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

void PythonAnalyzer::add_function(TSNode node, const ParserContext &context, model::FileAnalysis &result) {
    TSNode name_node = child_by_field(node, "name");
    if (ts_node_is_null(name_node)) {
        return;
    }

    std::string name = extract_node_text(name_node, context.file_content);
    model::CodeNode function_node = make_unit(node, name, model::NodeKind::function, context);
    spdlog::debug("Found Python function: {} (lines {}-{})",
                  name, function_node.line, function_node.line + function_node.lines_of_code - 1);
    result.nodes.push_back(std::move(function_node));
}

void PythonAnalyzer::collect_imports(TSNode node,
                                     const ParserContext &context,
                                     std::vector<model::CodeDependency> &imports) {
    const std::string &source = context.file_content;
    std::vector<std::string> targets;

    if (is_type(node, "import_statement")) {
        for (TSNode name : children_by_field(node, "name")) {
            targets.push_back(imported_name(name, source));
        }
    } else {
        std::string module = is_type(node, "future_import_statement")
            ? std::string("__future__")
            : from_module_name(node, source);

        for (TSNode name : children_by_field(node, "name")) {
            targets.push_back(module + "." + imported_name(name, source));
        }

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            if (is_type(ts_node_named_child(node, i), "wildcard_import")) {
                targets.push_back(module + ".*");
            }
        }
    }

    size_t line = line_of(node);
    for (auto &target : targets) {
        if (target.empty()) {
            continue;
        }
        model::CodeDependency edge;
        edge.source = context.module_name;
        edge.target = std::move(target);
        edge.kind = model::DependencyKind::imports;
        edge.line = line;
        imports.push_back(std::move(edge));
    }
}

std::string PythonAnalyzer::imported_name(TSNode name_node, const std::string &source) {
    if (is_type(name_node, "aliased_import")) {
        return extract_node_text(child_by_field(name_node, "name"), source);
    }
    return extract_node_text(name_node, source);
}

// `from .pkg import x` names module "pkg"; `from . import x` names "".
std::string PythonAnalyzer::from_module_name(TSNode statement, const std::string &source) {
    TSNode module = child_by_field(statement, "module_name");
    if (ts_node_is_null(module)) {
        return "";
    }
    if (is_type(module, "dotted_name")) {
        return extract_node_text(module, source);
    }

    uint32_t count = ts_node_named_child_count(module);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(module, i);
        if (is_type(child, "dotted_name")) {
            return extract_node_text(child, source);
        }
    }
    return "";
}

} // namespace depgraph::parser::languages
