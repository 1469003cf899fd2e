#include "parser/analyzer_registry.hpp"
#include "parser/languages/cpp_analyzer.hpp"
#include "parser/languages/null_analyzer.hpp"
#include "parser/languages/pattern_analyzer.hpp"
#include "parser/languages/python_analyzer.hpp"
#include <spdlog/spdlog.h>

namespace depgraph::parser {

bool AnalyzerRegistry::register_analyzer(std::unique_ptr<LanguageAnalyzer> analyzer) {
    if (!analyzer) {
        spdlog::error("Attempting to register null analyzer");
        return false;
    }
    if (!analyzer->initialize()) {
        spdlog::error("Analyzer for {} failed to initialize", analyzer->get_language_name());
        return false;
    }

    auto language_name = analyzer->get_language_name();
    for (const auto &ext : analyzer->get_extensions()) {
        extensions_[ext] = language_name;
    }
    analyzers_[language_name] = std::move(analyzer);

    spdlog::debug("Registered {} analyzer", language_name);
    return true;
}

std::unique_ptr<LanguageAnalyzer> AnalyzerRegistry::analyzer_for(const std::string &language) const {
    auto it = analyzers_.find(language);
    if (it == analyzers_.end()) {
        return nullptr;
    }

    auto analyzer = it->second->clone();
    if (!analyzer->initialize()) {
        spdlog::error("Failed to initialize {} analyzer", language);
        return nullptr;
    }
    return analyzer;
}

bool AnalyzerRegistry::supports(const std::string &language) const {
    return analyzers_.count(language) > 0;
}

std::vector<std::string> AnalyzerRegistry::get_supported_languages() const {
    std::vector<std::string> languages;
    languages.reserve(analyzers_.size());
    for (const auto &[language, _] : analyzers_) {
        languages.push_back(language);
    }
    return languages;
}

config::LanguageTable AnalyzerRegistry::language_table() const {
    return extensions_;
}

AnalyzerRegistry make_default_registry() {
    AnalyzerRegistry registry;

    auto add = [&registry](std::unique_ptr<LanguageAnalyzer> analyzer) {
        std::string language = analyzer->get_language_name();
        if (!registry.register_analyzer(std::move(analyzer))) {
            spdlog::warn("{} files will not be analyzed", language);
        }
    };

    add(std::make_unique<languages::PythonAnalyzer>());
    add(std::make_unique<languages::CppAnalyzer>());
    add(std::make_unique<languages::PatternAnalyzer>(languages::javascript_patterns()));
    add(std::make_unique<languages::PatternAnalyzer>(languages::typescript_patterns()));

    const std::vector<std::pair<std::string, std::vector<std::string>>> pending = {
        {"java", {"java"}},
        {"c", {"c"}},
        {"csharp", {"cs"}},
        {"php", {"php"}},
        {"ruby", {"rb"}},
        {"go", {"go"}},
        {"rust", {"rs"}}
    };
    for (const auto &[language, extensions] : pending) {
        add(std::make_unique<languages::NullAnalyzer>(language, extensions));
    }

    return registry;
}

} // namespace depgraph::parser
