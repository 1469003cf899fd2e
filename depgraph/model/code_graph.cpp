#include "model/code_graph.hpp"

namespace depgraph::model {

std::string to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::module:   return "module";
        case NodeKind::class_:   return "class";
        case NodeKind::function: return "function";
        case NodeKind::variable: return "variable";
    }
    return "unknown";
}

std::string to_string(DependencyKind kind) {
    switch (kind) {
        case DependencyKind::imports:  return "imports";
        case DependencyKind::calls:    return "calls";
        case DependencyKind::inherits: return "inherits";
        case DependencyKind::uses:     return "uses";
    }
    return "unknown";
}

bool CodeNode::operator==(const CodeNode& other) const {
    return id == other.id &&
           name == other.name &&
           kind == other.kind &&
           language == other.language &&
           path == other.path &&
           line == other.line &&
           complexity == other.complexity &&
           lines_of_code == other.lines_of_code &&
           dependency_refs == other.dependency_refs;
}

bool CodeDependency::operator==(const CodeDependency& other) const {
    return source == other.source &&
           target == other.target &&
           kind == other.kind &&
           weight == other.weight &&
           line == other.line;
}

bool GraphMetadata::operator==(const GraphMetadata& other) const {
    return total_files == other.total_files &&
           total_nodes == other.total_nodes &&
           total_dependencies == other.total_dependencies &&
           languages == other.languages &&
           partial == other.partial &&
           files_skipped == other.files_skipped &&
           read_failures == other.read_failures &&
           parse_failures == other.parse_failures;
}

std::string make_node_id(const std::string& module_name, const std::string& unit_name) {
    return module_name + "." + unit_name;
}

} // namespace depgraph::model
