#ifndef DEPGRAPH_UTILS_FILESYSTEM_HPP
#define DEPGRAPH_UTILS_FILESYSTEM_HPP

#pragma once

#include <cstddef>
#include <filesystem>
#include <llvm/Support/Regex.h>
#include <string>
#include <vector>

namespace depgraph::utils {

// Whole-file read in binary mode. Throws std::system_error when the file
// cannot be opened or read.
std::string read_file_bytes(const std::filesystem::path &file_path);

// True when the first block of the file contains NUL bytes. Files that
// cannot be opened report false; the caller decides what to do with them.
bool looks_binary(const std::filesystem::path &file_path, size_t sample_size = 1024);

bool is_readable_file(const std::filesystem::path &file_path);

// A set of path patterns compiled once. Each pattern is a POSIX extended
// regular expression searched anywhere in the path; a pattern that does not
// compile degrades to a substring match.
class PathMatcher {
public:
    PathMatcher() = default;
    explicit PathMatcher(const std::vector<std::string> &patterns);

    bool matches(const std::string &path) const;
    bool empty() const { return regexes_.empty() && substrings_.empty(); }

private:
    std::vector<llvm::Regex> regexes_;
    std::vector<std::string> substrings_;
};

// Lowercased extension without the leading dot ("py" for "a/b.PY").
std::string extension_of(const std::filesystem::path &file_path);

// Forward-slash relative path of path under base.
std::string relative_generic_path(const std::filesystem::path &base, const std::filesystem::path &path);

} // namespace depgraph::utils

#endif // DEPGRAPH_UTILS_FILESYSTEM_HPP
