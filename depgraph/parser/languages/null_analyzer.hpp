#ifndef DEPGRAPH_PARSER_NULL_ANALYZER_HPP
#define DEPGRAPH_PARSER_NULL_ANALYZER_HPP

#pragma once

#include "parser/analyzer_base.hpp"
#include <memory>
#include <string>
#include <vector>

namespace depgraph::parser::languages {

// Recognized file type that is not analyzed yet. Files still count as
// analyzed in the graph metadata; they contribute no nodes or edges.
class NullAnalyzer : public LanguageAnalyzer {
public:
    NullAnalyzer(std::string language, std::vector<std::string> extensions)
        : language_(std::move(language)), extensions_(std::move(extensions)) {}

    std::unique_ptr<LanguageAnalyzer> clone() const override {
        return std::make_unique<NullAnalyzer>(language_, extensions_);
    }

    bool initialize() override { return true; }

    model::FileAnalysis analyze(const ParserContext &) override { return {}; }

    std::vector<std::string> get_extensions() const override { return extensions_; }
    std::string get_language_name() const override { return language_; }

private:
    std::string language_;
    std::vector<std::string> extensions_;
};

} // namespace depgraph::parser::languages

#endif // DEPGRAPH_PARSER_NULL_ANALYZER_HPP
