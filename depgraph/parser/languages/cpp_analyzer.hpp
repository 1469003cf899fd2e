#ifndef DEPGRAPH_PARSER_CPP_ANALYZER_HPP
#define DEPGRAPH_PARSER_CPP_ANALYZER_HPP

#pragma once

#include "parser/analyzer_base.hpp"
#include <memory>
#include <string>
#include <vector>

// Forward declare the tree-sitter function
extern "C" {
    const TSLanguage* tree_sitter_cpp();
}

namespace depgraph::parser::languages {

// Tree-based analyzer for C++. #include directives become imports edges to
// the header path, class and struct definitions become class nodes with
// inherits edges to plain-name bases, and function definitions become
// function nodes. Units are reported in source order.
class CppAnalyzer : public TreeSitterAnalyzer {
public:
    CppAnalyzer() = default;

    CppAnalyzer(const CppAnalyzer&) = delete;
    CppAnalyzer& operator=(const CppAnalyzer&) = delete;
    CppAnalyzer(CppAnalyzer&&) = default;
    CppAnalyzer& operator=(CppAnalyzer&&) = default;

    ~CppAnalyzer() override = default;

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
    void add_include(TSNode node, const ParserContext &context, model::FileAnalysis &result);
    void add_class(TSNode node, const ParserContext &context, model::FileAnalysis &result);
    void add_function(TSNode node, const ParserContext &context, model::FileAnalysis &result);

    static TSNode find_function_name(TSNode declarator);
    static TSNode unqualified_name(TSNode name);
};

} // namespace depgraph::parser::languages

#endif // DEPGRAPH_PARSER_CPP_ANALYZER_HPP
