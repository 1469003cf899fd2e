#ifndef DEPGRAPH_LOADER_TEXT_LOADER_HPP
#define DEPGRAPH_LOADER_TEXT_LOADER_HPP

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace depgraph::loader {

enum class Encoding {
    utf8,
    latin1
};

std::string to_string(Encoding encoding);

// A file that could not be opened or decoded. Recoverable: the project scan
// skips the file and continues.
class ReadFailure : public std::runtime_error {
public:
    ReadFailure(std::filesystem::path path, std::string cause)
        : std::runtime_error("Failed to read " + path.string() + ": " + cause),
          path_(std::move(path)),
          cause_(std::move(cause)) {}

    const std::filesystem::path &path() const { return path_; }
    const std::string &cause() const { return cause_; }

private:
    std::filesystem::path path_;
    std::string cause_;
};

struct LoadedText {
    std::string text;  // always UTF-8
    Encoding encoding{Encoding::utf8};
};

class TextLoader {
public:
    TextLoader() = default;
    TextLoader(Encoding primary, Encoding fallback) : primary_(primary), fallback_(fallback) {}

    // Throws ReadFailure.
    LoadedText load(const std::filesystem::path &file_path) const;

    // Decoding step alone, for text already in memory. Throws ReadFailure
    // (with an empty path) when neither encoding accepts the bytes.
    LoadedText decode(std::string bytes) const;

private:
    static bool try_decode(Encoding encoding, std::string &bytes);

    Encoding primary_{Encoding::utf8};
    Encoding fallback_{Encoding::latin1};
};

} // namespace depgraph::loader

#endif // DEPGRAPH_LOADER_TEXT_LOADER_HPP
