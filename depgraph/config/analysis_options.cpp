#include "config/analysis_options.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <thread>

namespace depgraph::config {

namespace {

std::string trim(const std::string &text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

unsigned int AnalysisOptions::effective_workers() const {
    if (max_workers > 0) {
        return max_workers;
    }
    unsigned int hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 1;
}

std::vector<std::string> AnalysisOptions::default_ignore_patterns() {
    // Matched against root-relative paths with forward slashes.
    return {
        "(^|/)\\.git(/|$)",
        "(^|/)node_modules(/|$)",
        "(^|/)__pycache__(/|$)",
        "(^|/)\\.venv(/|$)"
    };
}

std::pair<std::string, std::string> parse_language_mapping(const std::string &mapping) {
    auto pos = mapping.find('=');
    if (pos == std::string::npos) {
        throw std::invalid_argument("language mapping must look like ext=language: " + mapping);
    }

    std::string ext = trim(mapping.substr(0, pos));
    std::string language = trim(mapping.substr(pos + 1));
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    if (ext.empty() || language.empty()) {
        throw std::invalid_argument("empty extension or language in mapping: " + mapping);
    }

    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return {ext, language};
}

std::optional<IdScheme> parse_id_scheme(const std::string &name) {
    if (name == "stem") {
        return IdScheme::file_stem;
    }
    if (name == "path") {
        return IdScheme::relative_path;
    }
    return std::nullopt;
}

std::string to_string(IdScheme scheme) {
    switch (scheme) {
        case IdScheme::file_stem:     return "stem";
        case IdScheme::relative_path: return "path";
    }
    return "stem";
}

} // namespace depgraph::config
