#ifndef DEPGRAPH_ANALYSIS_GRAPH_ASSEMBLER_HPP
#define DEPGRAPH_ANALYSIS_GRAPH_ASSEMBLER_HPP

#pragma once

#include "analysis/file_result.hpp"
#include "model/code_graph.hpp"
#include <cstddef>

namespace depgraph::analysis {

// Accumulates per-file results in the order they are added. Nothing is
// deduplicated and edge targets are not checked against node ids.
class GraphAssembler {
public:
    void add(FileResult result);

    void mark_partial() { partial_ = true; }

    size_t files_added() const { return files_added_; }

    // Computes the metadata and hands the graph over; the assembler is
    // empty afterwards.
    model::DependencyGraph finish();

private:
    model::DependencyGraph graph_;
    size_t files_added_{0};
    size_t files_analyzed_{0};
    size_t files_skipped_{0};
    size_t read_failures_{0};
    size_t parse_failures_{0};
    bool partial_{false};
};

} // namespace depgraph::analysis

#endif // DEPGRAPH_ANALYSIS_GRAPH_ASSEMBLER_HPP
