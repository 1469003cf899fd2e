#ifndef DEPGRAPH_PARSER_ANALYZER_REGISTRY_HPP
#define DEPGRAPH_PARSER_ANALYZER_REGISTRY_HPP

#pragma once

#include "config/analysis_options.hpp"
#include "parser/analyzer_base.hpp"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace depgraph::parser {

// Language identifier -> analyzer prototype. Built once and handed to the
// project analyzer; every lookup returns a fresh initialized clone so
// concurrent workers never share parser state.
class AnalyzerRegistry {
public:
    AnalyzerRegistry() = default;
    AnalyzerRegistry(const AnalyzerRegistry&) = delete;
    AnalyzerRegistry& operator=(const AnalyzerRegistry&) = delete;
    AnalyzerRegistry(AnalyzerRegistry&&) = default;
    AnalyzerRegistry& operator=(AnalyzerRegistry&&) = default;

    template<typename T, typename... Args>
    bool register_analyzer(Args&&... args) {
        return register_analyzer(std::make_unique<T>(std::forward<Args>(args)...));
    }

    // Replaces any analyzer already registered for the same language.
    // Returns false when the analyzer fails to initialize.
    bool register_analyzer(std::unique_ptr<LanguageAnalyzer> analyzer);

    // nullptr for unsupported languages.
    std::unique_ptr<LanguageAnalyzer> analyzer_for(const std::string &language) const;

    bool supports(const std::string &language) const;

    std::vector<std::string> get_supported_languages() const;

    // Extension table declared by the registered analyzers.
    config::LanguageTable language_table() const;

private:
    std::map<std::string, std::unique_ptr<LanguageAnalyzer>> analyzers_;
    config::LanguageTable extensions_;
};

// Python and C++ (tree-sitter), JavaScript and TypeScript (patterns), and
// null analyzers for java, c, csharp, php, ruby, go and rust.
AnalyzerRegistry make_default_registry();

} // namespace depgraph::parser

#endif // DEPGRAPH_PARSER_ANALYZER_REGISTRY_HPP
