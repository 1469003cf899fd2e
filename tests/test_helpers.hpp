#ifndef DEPGRAPH_TESTS_TEST_HELPERS_HPP
#define DEPGRAPH_TESTS_TEST_HELPERS_HPP

#pragma once

#include "model/code_graph.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace depgraph::testing {

namespace fs = std::filesystem;

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("depgraph_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path &path() const { return path_; }

    fs::path write(const std::string &relative, const std::string &content) const {
        fs::path file = path_ / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

private:
    fs::path path_;
};

inline std::vector<std::string> node_names(const std::vector<model::CodeNode> &nodes) {
    std::vector<std::string> names;
    for (const auto &node : nodes) {
        names.push_back(node.name);
    }
    return names;
}

inline std::vector<std::string> edge_targets(const std::vector<model::CodeDependency> &edges,
                                             model::DependencyKind kind) {
    std::vector<std::string> targets;
    for (const auto &edge : edges) {
        if (edge.kind == kind) {
            targets.push_back(edge.target);
        }
    }
    return targets;
}

inline const model::CodeNode *find_node(const std::vector<model::CodeNode> &nodes, const std::string &name) {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&name](const model::CodeNode &node) { return node.name == name; });
    return it == nodes.end() ? nullptr : &*it;
}

} // namespace depgraph::testing

#endif // DEPGRAPH_TESTS_TEST_HELPERS_HPP
