#ifndef DEPGRAPH_PARSER_PYTHON_ANALYZER_HPP
#define DEPGRAPH_PARSER_PYTHON_ANALYZER_HPP

#pragma once

#include "parser/analyzer_base.hpp"
#include <deque>
#include <memory>
#include <string>
#include <vector>

extern "C" {
    const TSLanguage* tree_sitter_python();
}

namespace depgraph::parser::languages {

// Tree-based analyzer for Python.
//
// Units are reported in breadth-first order over statement nesting, the
// order of Python's ast.walk: block, else, finally and with wrappers do not
// count as levels, and each elif nests inside the one before it. Every
// class and function definition (methods, nested and async functions
// included) becomes a node. Edges:
//   - inherits: class -> each base written as a plain name, in order
//   - imports:  module -> "a.b" for `import a.b`, "x.y" for `from x import y`,
//               "x.*" for `from x import *`. Aliases are not followed.
// All inherits edges come before the imports edges.
class PythonAnalyzer : public TreeSitterAnalyzer {
public:
    PythonAnalyzer() = default;

    PythonAnalyzer(const PythonAnalyzer&) = delete;
    PythonAnalyzer& operator=(const PythonAnalyzer&) = delete;
    PythonAnalyzer(PythonAnalyzer&&) = default;
    PythonAnalyzer& operator=(PythonAnalyzer&&) = default;

    ~PythonAnalyzer() override = default;

    std::unique_ptr<LanguageAnalyzer> clone() const override;
    std::vector<std::string> get_extensions() const override;
    std::string get_language_name() const override;

protected:
    const TSLanguage *language() const override;
    const complexity::BranchRules &branch_rules() const override;
    void collect(const std::vector<TSNode> &top_level,
                 const ParserContext &context,
                 model::FileAnalysis &result) override;

private:
    // One step of the breadth-first walk. An elif clause carries the
    // alternatives written after it.
    struct Visit {
        TSNode node;
        std::vector<TSNode> later_alternatives;
    };

    static void enqueue_children(const Visit &visit, std::deque<Visit> &queue);
    static void push_spliced(TSNode node, std::deque<Visit> &queue);

    void add_class(TSNode node, const ParserContext &context, model::FileAnalysis &result);
    void add_function(TSNode node, const ParserContext &context, model::FileAnalysis &result);
    void collect_imports(TSNode node, const ParserContext &context,
                         std::vector<model::CodeDependency> &imports);

    static std::string imported_name(TSNode name_node, const std::string &source);
    static std::string from_module_name(TSNode statement, const std::string &source);
};

} // namespace depgraph::parser::languages

#endif // DEPGRAPH_PARSER_PYTHON_ANALYZER_HPP
