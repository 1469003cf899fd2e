#include "analysis/graph_assembler.hpp"
#include <iterator>
#include <set>
#include <spdlog/spdlog.h>

namespace depgraph::analysis {

std::string to_string(FileStatus status) {
    switch (status) {
        case FileStatus::analyzed:      return "analyzed";
        case FileStatus::parse_failure: return "parse_failure";
        case FileStatus::read_failure:  return "read_failure";
        case FileStatus::unsupported:   return "unsupported";
    }
    return "unknown";
}

void GraphAssembler::add(FileResult result) {
    ++files_added_;

    switch (result.status) {
        case FileStatus::analyzed:
            ++files_analyzed_;
            break;
        case FileStatus::parse_failure:
            ++files_analyzed_;
            ++parse_failures_;
            break;
        case FileStatus::read_failure:
            ++read_failures_;
            break;
        case FileStatus::unsupported:
            ++files_skipped_;
            break;
    }

    auto &nodes = result.analysis.nodes;
    auto &edges = result.analysis.edges;
    graph_.nodes.insert(graph_.nodes.end(),
                        std::make_move_iterator(nodes.begin()),
                        std::make_move_iterator(nodes.end()));
    graph_.edges.insert(graph_.edges.end(),
                        std::make_move_iterator(edges.begin()),
                        std::make_move_iterator(edges.end()));
}

model::DependencyGraph GraphAssembler::finish() {
    std::set<std::string> languages;
    for (const auto &node : graph_.nodes) {
        languages.insert(node.language);
    }

    model::GraphMetadata &metadata = graph_.metadata;
    metadata.total_files = files_analyzed_;
    metadata.total_nodes = graph_.nodes.size();
    metadata.total_dependencies = graph_.edges.size();
    metadata.languages.assign(languages.begin(), languages.end());
    metadata.partial = partial_;
    metadata.files_skipped = files_skipped_;
    metadata.read_failures = read_failures_;
    metadata.parse_failures = parse_failures_;

    spdlog::debug("Assembled graph: {} file(s), {} node(s), {} edge(s){}",
                  metadata.total_files, metadata.total_nodes, metadata.total_dependencies,
                  partial_ ? " (partial)" : "");

    model::DependencyGraph graph = std::move(graph_);
    *this = GraphAssembler();
    return graph;
}

} // namespace depgraph::analysis
