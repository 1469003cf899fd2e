#ifndef DEPGRAPH_MODEL_GRAPH_JSON_HPP
#define DEPGRAPH_MODEL_GRAPH_JSON_HPP

#pragma once

#include "model/code_graph.hpp"
#include <llvm/Support/JSON.h>
#include <string>

namespace depgraph::model {

llvm::json::Value to_json(const CodeNode& node);
llvm::json::Value to_json(const CodeDependency& edge);
llvm::json::Value to_json(const GraphMetadata& metadata);

// Plain {nodes, edges, metadata} document for callers that persist or
// transmit the graph.
llvm::json::Value to_json(const DependencyGraph& graph);

std::string to_json_string(const DependencyGraph& graph, bool pretty = true);

} // namespace depgraph::model

#endif // DEPGRAPH_MODEL_GRAPH_JSON_HPP
