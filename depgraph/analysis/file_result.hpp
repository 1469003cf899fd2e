#ifndef DEPGRAPH_ANALYSIS_FILE_RESULT_HPP
#define DEPGRAPH_ANALYSIS_FILE_RESULT_HPP

#pragma once

#include "model/code_graph.hpp"
#include <filesystem>
#include <string>

namespace depgraph::analysis {

enum class FileStatus {
    analyzed,       // analyzer ran cleanly (null analyzers included)
    parse_failure,  // analyzer ran; analysis holds the partial result
    read_failure,   // file could not be loaded; analysis is empty
    unsupported     // no analyzer registered for the language
};

std::string to_string(FileStatus status);

// Outcome of one file's load-and-analyze task.
struct FileResult {
    std::filesystem::path path;
    std::string language;
    FileStatus status{FileStatus::analyzed};
    model::FileAnalysis analysis;
    std::string error;

    // True when an analyzer processed the file, even partially.
    bool reached_analyzer() const {
        return status == FileStatus::analyzed || status == FileStatus::parse_failure;
    }
};

} // namespace depgraph::analysis

#endif // DEPGRAPH_ANALYSIS_FILE_RESULT_HPP
