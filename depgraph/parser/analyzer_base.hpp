#ifndef DEPGRAPH_PARSER_ANALYZER_BASE_HPP
#define DEPGRAPH_PARSER_ANALYZER_BASE_HPP

#pragma once

#include "complexity/cyclomatic_complexity.hpp"
#include "model/code_graph.hpp"
#include <memory>
#include <string>
#include <vector>
#include <tree_sitter/api.h>

namespace depgraph::parser {

struct ParserContext {
    std::string file_content;
    std::string file_path;
    std::string module_name;  // prefix of every node id produced for the file
};

// One language's extraction of nodes and edges from file text.
//
// analyze() must not throw: parse problems are reported through
// FileAnalysis::parse_error together with whatever was extracted.
class LanguageAnalyzer {
public:
    LanguageAnalyzer() = default;
    LanguageAnalyzer(const LanguageAnalyzer&) = delete;
    LanguageAnalyzer& operator=(const LanguageAnalyzer&) = delete;
    LanguageAnalyzer(LanguageAnalyzer&&) = default;
    LanguageAnalyzer& operator=(LanguageAnalyzer&&) = default;
    virtual ~LanguageAnalyzer() = default;

    // Fresh, uninitialized instance of the same analyzer
    virtual std::unique_ptr<LanguageAnalyzer> clone() const = 0;

    virtual bool initialize() = 0;
    virtual model::FileAnalysis analyze(const ParserContext &context) = 0;
    virtual std::vector<std::string> get_extensions() const = 0;
    virtual std::string get_language_name() const = 0;
};

// Shared driver for analyzers backed by a tree-sitter grammar. Subclasses
// supply the grammar and walk the top-level statements that parsed cleanly.
class TreeSitterAnalyzer : public LanguageAnalyzer {
public:
    TreeSitterAnalyzer() : parser_(ts_parser_new(), ts_parser_delete) {}

    bool initialize() override;
    model::FileAnalysis analyze(const ParserContext &context) final;

protected:
    virtual const TSLanguage *language() const = 0;
    virtual const complexity::BranchRules &branch_rules() const = 0;

    // top_level holds the root's named children up to, not including, the
    // first one containing a syntax error.
    virtual void collect(const std::vector<TSNode> &top_level,
                         const ParserContext &context,
                         model::FileAnalysis &result) = 0;

    // Class or function node with metrics filled from the complexity
    // estimator.
    model::CodeNode make_unit(TSNode definition,
                              const std::string &name,
                              model::NodeKind kind,
                              const ParserContext &context) const;

    static std::string extract_node_text(TSNode node, const std::string &source_code);
    static TSNode child_by_field(TSNode node, const char *field);
    static std::vector<TSNode> children_by_field(TSNode node, const char *field);
    static size_t line_of(TSNode node);
    static bool is_type(TSNode node, const char *type);

    std::unique_ptr<TSParser, void(*)(TSParser*)> parser_;

private:
    static TSNode find_first_error(TSNode node);
};

} // namespace depgraph::parser

#endif // DEPGRAPH_PARSER_ANALYZER_BASE_HPP
