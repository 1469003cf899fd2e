#ifndef DEPGRAPH_CONFIG_ANALYSIS_OPTIONS_HPP
#define DEPGRAPH_CONFIG_ANALYSIS_OPTIONS_HPP

#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace depgraph::config {

// File extension (lowercase, no dot) -> language identifier.
using LanguageTable = std::map<std::string, std::string>;

// How the module part of a node id is derived from a file path.
enum class IdScheme {
    file_stem,      // "util" for src/pkg/util.py
    relative_path   // "src.pkg.util" for src/pkg/util.py
};

struct AnalysisOptions {
    // Unset means "every extension the registry's analyzers declare".
    std::optional<LanguageTable> language_table;

    std::vector<std::string> ignore_patterns = default_ignore_patterns();

    // Worker threads for project scans; 0 picks the hardware concurrency.
    unsigned int max_workers{0};

    // Merge per-file results in catalog order (deterministic output). When
    // false results are merged as workers complete.
    bool ordered_merge{true};

    IdScheme id_scheme{IdScheme::file_stem};

    unsigned int effective_workers() const;

    static std::vector<std::string> default_ignore_patterns();
};

// Parses "ext=language" (a leading dot on ext is accepted). Throws
// std::invalid_argument on malformed input.
std::pair<std::string, std::string> parse_language_mapping(const std::string &mapping);

std::optional<IdScheme> parse_id_scheme(const std::string &name);
std::string to_string(IdScheme scheme);

} // namespace depgraph::config

#endif // DEPGRAPH_CONFIG_ANALYSIS_OPTIONS_HPP
