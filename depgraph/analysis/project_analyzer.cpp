#include "analysis/project_analyzer.hpp"
#include "analysis/graph_assembler.hpp"
#include "utils/filesystem.hpp"
#include <algorithm>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <spdlog/spdlog.h>
#include <system_error>
#include <thread>
#include <vector>

namespace depgraph::analysis {

namespace fs = std::filesystem;

ProjectAnalyzer::ProjectAnalyzer(const parser::AnalyzerRegistry &registry,
                                 config::AnalysisOptions options)
    : registry_(registry),
      options_(std::move(options)),
      language_table_(options_.language_table ? *options_.language_table : registry.language_table())
{
}

model::DependencyGraph ProjectAnalyzer::analyze_project(const fs::path &root,
                                                        const CancellationToken *cancellation) const {
    catalog::SourceCatalog catalog(root, language_table_, options_.ignore_patterns);
    spdlog::info("Analyzing project: {}", root.string());

    GraphAssembler assembler;

    // Dispatch side: the catalog is lazy and not thread-safe.
    std::mutex dispatch_mutex;
    size_t next_sequence = 0;
    bool stopped = false;
    bool cancelled = false;
    std::exception_ptr failure;

    // Merge side: results wait here until every earlier file is merged.
    std::mutex merge_mutex;
    std::map<size_t, FileResult> waiting;
    size_t next_to_merge = 0;

    auto merge = [&](size_t sequence, FileResult result) {
        std::lock_guard<std::mutex> lock(merge_mutex);
        if (!options_.ordered_merge) {
            assembler.add(std::move(result));
            return;
        }

        waiting.emplace(sequence, std::move(result));
        while (!waiting.empty() && waiting.begin()->first == next_to_merge) {
            assembler.add(std::move(waiting.begin()->second));
            waiting.erase(waiting.begin());
            ++next_to_merge;
        }
    };

    auto worker = [&]() {
        while (true) {
            std::optional<catalog::SourceFile> file;
            size_t sequence = 0;
            {
                std::lock_guard<std::mutex> lock(dispatch_mutex);
                if (stopped) {
                    return;
                }
                if (cancellation && cancellation->is_cancelled()) {
                    stopped = true;
                    cancelled = true;
                    return;
                }
                try {
                    file = catalog.next();
                } catch (const std::exception &e) {
                    spdlog::error("Directory traversal failed under {}: {}", root.string(), e.what());
                    failure = std::current_exception();
                    stopped = true;
                    return;
                }
                if (!file) {
                    stopped = true;
                    return;
                }
                sequence = next_sequence++;
            }

            merge(sequence, analyze_source(*file, root));
        }
    };

    unsigned int worker_count = options_.effective_workers();
    std::vector<std::thread> threads;
    for (unsigned int i = 1; i < worker_count; ++i) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error &e) {
            spdlog::warn("Could not start worker thread {}: {}; continuing with {}",
                         i, e.what(), threads.size() + 1);
            break;
        }
    }
    worker();
    for (auto &thread : threads) {
        thread.join();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    if (cancelled) {
        spdlog::warn("Analysis of {} cancelled after {} file(s); returning partial graph",
                     root.string(), assembler.files_added());
        assembler.mark_partial();
    }

    return assembler.finish();
}

model::FileAnalysis ProjectAnalyzer::analyze_file(const fs::path &file_path) const {
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        spdlog::warn("Not a regular file: {}", file_path.string());
        return {};
    }

    auto it = language_table_.find(utils::extension_of(file_path));
    if (it == language_table_.end()) {
        spdlog::info("Unsupported language for file {}", file_path.string());
        return {};
    }

    fs::path root = file_path.has_parent_path() ? file_path.parent_path() : fs::path(".");
    FileResult result = analyze_source(catalog::SourceFile{file_path, it->second}, root);
    return std::move(result.analysis);
}

FileResult ProjectAnalyzer::analyze_source(const catalog::SourceFile &file, const fs::path &root) const {
    FileResult result;
    result.path = file.path;
    result.language = file.language;

    auto analyzer = registry_.analyzer_for(file.language);
    if (!analyzer) {
        spdlog::info("No analyzer for {} ({}), skipping", file.path.string(), file.language);
        result.status = FileStatus::unsupported;
        return result;
    }

    parser::ParserContext context;
    context.file_path = file.path.string();
    context.module_name = module_name_for(file.path, root);

    try {
        context.file_content = loader_.load(file.path).text;
    } catch (const loader::ReadFailure &e) {
        spdlog::warn("Read failure for {}: {}", e.path().string(), e.cause());
        result.status = FileStatus::read_failure;
        result.error = e.cause();
        return result;
    }

    spdlog::debug("Analyzing file: {} as {}", context.file_path, file.language);
    try {
        result.analysis = analyzer->analyze(context);
    } catch (const std::exception &e) {
        spdlog::warn("Analyzer for {} threw on {}: {}", file.language, context.file_path, e.what());
        result.analysis = model::FileAnalysis{};
        result.analysis.parse_error = e.what();
    }

    if (result.analysis.parse_error) {
        result.status = FileStatus::parse_failure;
        result.error = *result.analysis.parse_error;
    }
    return result;
}

std::string ProjectAnalyzer::module_name_for(const fs::path &file_path, const fs::path &root) const {
    std::string stem = file_path.stem().string();
    if (options_.id_scheme == config::IdScheme::file_stem) {
        return stem;
    }

    fs::path relative = file_path.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        return stem;
    }

    std::string module = relative.replace_extension().generic_string();
    std::replace(module.begin(), module.end(), '/', '.');
    return module;
}

} // namespace depgraph::analysis
