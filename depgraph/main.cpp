#include "analysis/graph_assembler.hpp"
#include "analysis/project_analyzer.hpp"
#include "config/analysis_options.hpp"
#include "model/graph_json.hpp"
#include "parser/analyzer_registry.hpp"
#include "utils/filesystem.hpp"
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Format.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/raw_ostream.h>
#include <spdlog/spdlog.h>
#include <filesystem>

using namespace llvm;

// Command line options
static cl::OptionCategory DepgraphCategory("depgraph Options");

static cl::opt<std::string> InputPath(
    cl::Positional,
    cl::desc("<project root or source file>"),
    cl::Required,
    cl::cat(DepgraphCategory));

static cl::opt<unsigned> Jobs(
    "jobs",
    cl::desc("Worker threads for project scans (default: hardware concurrency)"),
    cl::init(0),
    cl::cat(DepgraphCategory));

static cl::list<std::string> LanguageMappings(
    "map",
    cl::desc("Map a file extension to a language, e.g. --map pyw=python (repeatable)"),
    cl::value_desc("ext=lang"),
    cl::cat(DepgraphCategory));

static cl::list<std::string> IgnorePatterns(
    "ignore",
    cl::desc("Regular expression of root-relative paths to skip (repeatable)"),
    cl::cat(DepgraphCategory));

static cl::opt<std::string> OutputFormat(
    "format",
    cl::desc("Output format (json, text)"),
    cl::init("json"),
    cl::cat(DepgraphCategory));

static cl::opt<std::string> IdSchemeName(
    "id-scheme",
    cl::desc("Module part of node ids: stem (file name) or path (relative path)"),
    cl::init("stem"),
    cl::cat(DepgraphCategory));

static cl::opt<bool> Unordered(
    "unordered",
    cl::desc("Merge files in completion order instead of traversal order"),
    cl::init(false),
    cl::cat(DepgraphCategory));

static cl::opt<bool> Verbose(
    "verbose",
    cl::desc("Enable verbose output"),
    cl::init(false),
    cl::cat(DepgraphCategory));

namespace {

void output_graph_text(const depgraph::model::DependencyGraph &graph) {
    for (const auto &node : graph.nodes) {
        outs() << depgraph::model::to_string(node.kind) << " " << node.id << "\n"
               << "  Language: " << node.language << "\n"
               << "  File: " << node.path;
        if (node.line > 0) {
            outs() << ":" << node.line;
        }
        outs() << "\n";
        if (node.lines_of_code > 0) {
            outs() << "  Lines: " << node.lines_of_code << "\n";
        }
        outs() << "  Complexity: " << format("%.1f", node.complexity) << "\n";
    }

    for (const auto &edge : graph.edges) {
        outs() << edge.source << " --" << depgraph::model::to_string(edge.kind)
               << "--> " << edge.target << "\n";
    }

    const auto &metadata = graph.metadata;
    outs() << "\nFiles: " << metadata.total_files
           << "  Nodes: " << metadata.total_nodes
           << "  Dependencies: " << metadata.total_dependencies << "\n";
    outs() << "Languages:";
    for (const auto &language : metadata.languages) {
        outs() << " " << language;
    }
    outs() << "\n";
    if (metadata.read_failures > 0 || metadata.parse_failures > 0) {
        outs() << "Read failures: " << metadata.read_failures
               << "  Parse failures: " << metadata.parse_failures << "\n";
    }
}

} // namespace

int main(int argc, char **argv) {
    InitLLVM X(argc, argv);

    // Parse command line options
    cl::HideUnrelatedOptions(DepgraphCategory);
    cl::ParseCommandLineOptions(argc, argv, "depgraph - source dependency graph extractor\n");

    // Configure spdlog
    if (Verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    try {
        depgraph::config::AnalysisOptions options;
        options.max_workers = Jobs;
        options.ordered_merge = !Unordered;

        auto scheme = depgraph::config::parse_id_scheme(IdSchemeName);
        if (!scheme) {
            spdlog::error("Unknown id scheme: {} (expected stem or path)", IdSchemeName.getValue());
            return 1;
        }
        options.id_scheme = *scheme;

        options.ignore_patterns.insert(options.ignore_patterns.end(),
                                       IgnorePatterns.begin(), IgnorePatterns.end());

        auto registry = depgraph::parser::make_default_registry();

        if (!LanguageMappings.empty()) {
            auto table = registry.language_table();
            for (const auto &mapping : LanguageMappings) {
                auto [ext, language] = depgraph::config::parse_language_mapping(mapping);
                if (!registry.supports(language)) {
                    spdlog::warn("No analyzer for language {}; .{} files will be skipped", language, ext);
                }
                table[ext] = language;
            }
            options.language_table = std::move(table);
        }

        depgraph::analysis::ProjectAnalyzer analyzer(registry, options);
        depgraph::model::DependencyGraph graph;

        std::filesystem::path input_path(InputPath.getValue());
        if (std::filesystem::is_regular_file(input_path)) {
            spdlog::info("Analyzing file: {}", input_path.string());
            depgraph::analysis::FileResult result;
            auto language = analyzer.language_table().find(depgraph::utils::extension_of(input_path));
            if (language == analyzer.language_table().end()) {
                spdlog::warn("Unsupported language for file {}", input_path.string());
                result.path = input_path;
                result.status = depgraph::analysis::FileStatus::unsupported;
            } else {
                depgraph::catalog::SourceFile file{input_path, language->second};
                result = analyzer.analyze_source(file, input_path.parent_path());
            }

            depgraph::analysis::GraphAssembler assembler;
            assembler.add(std::move(result));
            graph = assembler.finish();
        } else {
            graph = analyzer.analyze_project(input_path);
        }

        // Output results
        if (OutputFormat == "json") {
            outs() << depgraph::model::to_json_string(graph) << "\n";
        } else if (OutputFormat == "text") {
            output_graph_text(graph);
        } else {
            spdlog::error("Unknown output format: {}", OutputFormat.getValue());
            return 1;
        }
    } catch (const depgraph::catalog::RootNotFoundError &e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception &e) {
        spdlog::error("An error occurred: {}", e.what());
        return 1;
    }

    return 0;
}
