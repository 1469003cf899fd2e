#include "model/graph_json.hpp"
#include <llvm/Support/FormatVariadic.h>
#include <spdlog/spdlog.h>

namespace depgraph::model {

namespace json = llvm::json;

namespace {

// File names on Linux are arbitrary bytes and names derive from them.
// Invalid sequences become U+FFFD.
json::Value text(const std::string& value) {
    if (json::isUTF8(value)) {
        return value;
    }
    std::string fixed = json::fixUTF8(value);
    spdlog::debug("Replaced invalid UTF-8 in JSON string: {}", fixed);
    return fixed;
}

} // namespace

json::Value to_json(const CodeNode& node) {
    json::Array refs;
    for (const auto& ref : node.dependency_refs) {
        refs.push_back(text(ref));
    }

    return json::Object{
        {"id", text(node.id)},
        {"name", text(node.name)},
        {"type", to_string(node.kind)},
        {"language", text(node.language)},
        {"path", text(node.path)},
        {"line_number", static_cast<int64_t>(node.line)},
        {"complexity", node.complexity},
        {"lines_of_code", static_cast<int64_t>(node.lines_of_code)},
        {"dependencies", std::move(refs)},
    };
}

json::Value to_json(const CodeDependency& edge) {
    json::Value line = nullptr;
    if (edge.line) {
        line = static_cast<int64_t>(*edge.line);
    }

    return json::Object{
        {"source", text(edge.source)},
        {"target", text(edge.target)},
        {"type", to_string(edge.kind)},
        {"weight", edge.weight},
        {"line_number", std::move(line)},
    };
}

json::Value to_json(const GraphMetadata& metadata) {
    json::Array languages;
    for (const auto& language : metadata.languages) {
        languages.push_back(text(language));
    }

    return json::Object{
        {"total_files", static_cast<int64_t>(metadata.total_files)},
        {"total_nodes", static_cast<int64_t>(metadata.total_nodes)},
        {"total_dependencies", static_cast<int64_t>(metadata.total_dependencies)},
        {"languages", std::move(languages)},
        {"partial", metadata.partial},
        {"files_skipped", static_cast<int64_t>(metadata.files_skipped)},
        {"read_failures", static_cast<int64_t>(metadata.read_failures)},
        {"parse_failures", static_cast<int64_t>(metadata.parse_failures)},
    };
}

json::Value to_json(const DependencyGraph& graph) {
    json::Array nodes;
    nodes.reserve(graph.nodes.size());
    for (const auto& node : graph.nodes) {
        nodes.push_back(to_json(node));
    }

    json::Array edges;
    edges.reserve(graph.edges.size());
    for (const auto& edge : graph.edges) {
        edges.push_back(to_json(edge));
    }

    return json::Object{
        {"nodes", std::move(nodes)},
        {"edges", std::move(edges)},
        {"metadata", to_json(graph.metadata)},
    };
}

std::string to_json_string(const DependencyGraph& graph, bool pretty) {
    if (pretty) {
        return llvm::formatv("{0:2}", to_json(graph)).str();
    }
    return llvm::formatv("{0}", to_json(graph)).str();
}

} // namespace depgraph::model
