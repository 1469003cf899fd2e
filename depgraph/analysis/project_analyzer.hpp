#ifndef DEPGRAPH_ANALYSIS_PROJECT_ANALYZER_HPP
#define DEPGRAPH_ANALYSIS_PROJECT_ANALYZER_HPP

#pragma once

#include "analysis/file_result.hpp"
#include "catalog/source_catalog.hpp"
#include "config/analysis_options.hpp"
#include "loader/text_loader.hpp"
#include "model/code_graph.hpp"
#include "parser/analyzer_registry.hpp"
#include <atomic>
#include <filesystem>
#include <string>

namespace depgraph::analysis {

// Set from any thread to stop a running scan. Files already being analyzed
// finish; no further files are dispatched.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

// Drives catalog -> loader -> analyzer -> assembler over a project tree.
//
// Only an invalid project root is fatal (catalog::RootNotFoundError). Read
// failures, parse failures and analyzer exceptions are logged and the scan
// continues with the next file.
class ProjectAnalyzer {
public:
    explicit ProjectAnalyzer(const parser::AnalyzerRegistry &registry,
                             config::AnalysisOptions options = {});

    model::DependencyGraph analyze_project(const std::filesystem::path &root,
                                           const CancellationToken *cancellation = nullptr) const;

    // Single file outside a project scan. Returns an empty analysis for
    // missing, unreadable or unsupported files; a parse failure yields the
    // partial result.
    model::FileAnalysis analyze_file(const std::filesystem::path &file_path) const;

    // Per-file task of a project scan.
    FileResult analyze_source(const catalog::SourceFile &file,
                              const std::filesystem::path &root) const;

    std::string module_name_for(const std::filesystem::path &file_path,
                                const std::filesystem::path &root) const;

    const config::LanguageTable &language_table() const { return language_table_; }
    const config::AnalysisOptions &options() const { return options_; }

private:
    const parser::AnalyzerRegistry &registry_;
    config::AnalysisOptions options_;
    config::LanguageTable language_table_;
    loader::TextLoader loader_;
};

} // namespace depgraph::analysis

#endif // DEPGRAPH_ANALYSIS_PROJECT_ANALYZER_HPP
