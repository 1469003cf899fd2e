#ifndef DEPGRAPH_PARSER_PATTERN_ANALYZER_HPP
#define DEPGRAPH_PARSER_PATTERN_ANALYZER_HPP

#pragma once

#include "parser/analyzer_base.hpp"
#include <memory>
#include <string>
#include <vector>

namespace depgraph::parser::languages {

// POSIX extended regular expressions for one language. The last capture
// group of every pattern is the extracted name (import target, function or
// class name).
struct PatternSet {
    std::string language;
    std::vector<std::string> extensions;
    std::vector<std::string> import_patterns;
    std::vector<std::string> function_patterns;
    std::vector<std::string> class_patterns;
};

PatternSet javascript_patterns();
PatternSet typescript_patterns();

// Lower-fidelity analyzer for languages without a parser dependency. It
// recovers no positions (line 0), assigns complexity 1.0 and no line count.
// Missed constructs are acceptable; a bad file never fails the analyzer.
//
// Patterns are compiled once; clones share the compiled set.
class PatternAnalyzer : public LanguageAnalyzer {
public:
    explicit PatternAnalyzer(PatternSet patterns);

    std::unique_ptr<LanguageAnalyzer> clone() const override;
    bool initialize() override;
    model::FileAnalysis analyze(const ParserContext &context) override;
    std::vector<std::string> get_extensions() const override;
    std::string get_language_name() const override;

private:
    struct Compiled;

    PatternAnalyzer(PatternSet patterns, std::shared_ptr<const Compiled> compiled);

    void add_units(const std::vector<std::string> &names, model::NodeKind kind,
                   const ParserContext &context, model::FileAnalysis &result) const;

    PatternSet patterns_;
    std::shared_ptr<const Compiled> compiled_;
};

} // namespace depgraph::parser::languages

#endif // DEPGRAPH_PARSER_PATTERN_ANALYZER_HPP
