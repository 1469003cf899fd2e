#include "utils/filesystem.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <llvm/ADT/StringRef.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace depgraph::utils {

namespace fs = std::filesystem;

std::string read_file_bytes(const fs::path &file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        int err = errno != 0 ? errno : EACCES;
        throw std::system_error(err, std::generic_category(), "cannot open " + file_path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::system_error(EIO, std::generic_category(), "cannot read " + file_path.string());
    }
    return content;
}

bool looks_binary(const fs::path &file_path, size_t sample_size) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    std::array<char, 4096> buffer{};
    size_t wanted = std::min(sample_size, buffer.size());
    file.read(buffer.data(), static_cast<std::streamsize>(wanted));
    std::streamsize bytes_read = file.gcount();

    return std::find(buffer.begin(), buffer.begin() + bytes_read, '\0') != buffer.begin() + bytes_read;
}

bool is_readable_file(const fs::path &file_path) {
    std::ifstream file(file_path, std::ios::binary);
    return file.is_open();
}

PathMatcher::PathMatcher(const std::vector<std::string> &patterns) {
    for (const auto &pattern : patterns) {
        llvm::Regex regex(pattern);
        std::string error;
        if (regex.isValid(error)) {
            regexes_.push_back(std::move(regex));
        } else {
            spdlog::debug("Ignore pattern '{}' is not a regex ({}); matching it literally", pattern, error);
            substrings_.push_back(pattern);
        }
    }
}

bool PathMatcher::matches(const std::string &path) const {
    for (const auto &regex : regexes_) {
        if (regex.match(path)) {
            return true;
        }
    }
    return std::any_of(substrings_.begin(), substrings_.end(),
                       [&path](const std::string &substring) { return path.find(substring) != std::string::npos; });
}

std::string extension_of(const fs::path &file_path) {
    std::string ext = file_path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string relative_generic_path(const fs::path &base, const fs::path &path) {
    fs::path relative = path.lexically_relative(base);
    if (relative.empty()) {
        return path.generic_string();
    }
    return relative.generic_string();
}

} // namespace depgraph::utils
