#ifndef DEPGRAPH_MODEL_CODE_GRAPH_HPP
#define DEPGRAPH_MODEL_CODE_GRAPH_HPP

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace depgraph::model {

enum class NodeKind {
    module,
    class_,
    function,
    variable
};

enum class DependencyKind {
    imports,
    calls,
    inherits,
    uses
};

std::string to_string(NodeKind kind);
std::string to_string(DependencyKind kind);

// One syntactic unit discovered in a file.
struct CodeNode {
    std::string id;
    std::string name;
    NodeKind kind{NodeKind::function};
    std::string language;
    std::string path;
    size_t line{0};  // 1-based, 0 when unknown
    double complexity{0.0};
    size_t lines_of_code{0};
    std::vector<std::string> dependency_refs;

    bool operator==(const CodeNode& other) const;
    bool operator!=(const CodeNode& other) const { return !(*this == other); }
};

// Directed relation between two ids. The target does not have to name a
// node of the graph (external imports, unresolved bases).
struct CodeDependency {
    std::string source;
    std::string target;
    DependencyKind kind{DependencyKind::imports};
    double weight{1.0};
    std::optional<size_t> line;

    bool operator==(const CodeDependency& other) const;
    bool operator!=(const CodeDependency& other) const { return !(*this == other); }
};

struct GraphMetadata {
    size_t total_files{0};
    size_t total_nodes{0};
    size_t total_dependencies{0};
    std::vector<std::string> languages;  // sorted, distinct

    bool partial{false};
    size_t files_skipped{0};
    size_t read_failures{0};
    size_t parse_failures{0};

    bool operator==(const GraphMetadata& other) const;
    bool operator!=(const GraphMetadata& other) const { return !(*this == other); }
};

struct DependencyGraph {
    std::vector<CodeNode> nodes;
    std::vector<CodeDependency> edges;
    GraphMetadata metadata;
};

// Per-file analyzer output.
struct FileAnalysis {
    std::vector<CodeNode> nodes;
    std::vector<CodeDependency> edges;
    std::optional<std::string> parse_error;

    bool empty() const { return nodes.empty() && edges.empty(); }
};

std::string make_node_id(const std::string& module_name, const std::string& unit_name);

} // namespace depgraph::model

#endif // DEPGRAPH_MODEL_CODE_GRAPH_HPP
