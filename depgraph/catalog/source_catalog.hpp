#ifndef DEPGRAPH_CATALOG_SOURCE_CATALOG_HPP
#define DEPGRAPH_CATALOG_SOURCE_CATALOG_HPP

#pragma once

#include "config/analysis_options.hpp"
#include "utils/filesystem.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace depgraph::catalog {

class RootNotFoundError : public std::runtime_error {
public:
    explicit RootNotFoundError(const std::filesystem::path &root)
        : std::runtime_error("Project root does not exist or is not a directory: " + root.string()),
          root_(root) {}

    const std::filesystem::path &root() const { return root_; }

private:
    std::filesystem::path root_;
};

struct SourceFile {
    std::filesystem::path path;
    std::string language;
};

// Lazy depth-first walk over a project tree. Entries of every directory are
// visited in lexicographic order so two walks of an unchanged tree agree.
// The sequence is consumed by next() and cannot be restarted.
class SourceCatalog {
public:
    SourceCatalog(std::filesystem::path root,
                  config::LanguageTable language_table,
                  std::vector<std::string> ignore_patterns = {});

    SourceCatalog(const SourceCatalog&) = delete;
    SourceCatalog& operator=(const SourceCatalog&) = delete;
    SourceCatalog(SourceCatalog&&) = default;
    SourceCatalog& operator=(SourceCatalog&&) = default;

    std::optional<SourceFile> next();

    bool exhausted() const { return pending_.empty(); }
    const std::filesystem::path &root() const { return root_; }

    std::optional<std::string> language_for(const std::filesystem::path &file_path) const;

private:
    struct DirectoryFrame {
        std::vector<std::filesystem::path> entries;  // sorted
        size_t position{0};
    };

    void push_directory(const std::filesystem::path &directory);
    bool is_ignored(const std::filesystem::path &path) const;
    std::optional<SourceFile> accept_file(const std::filesystem::path &path) const;

    std::filesystem::path root_;
    config::LanguageTable language_table_;
    utils::PathMatcher ignore_;
    std::vector<DirectoryFrame> pending_;
};

} // namespace depgraph::catalog

#endif // DEPGRAPH_CATALOG_SOURCE_CATALOG_HPP
