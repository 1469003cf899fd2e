#include "catalog/source_catalog.hpp"
#include "utils/filesystem.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace depgraph::catalog {

namespace fs = std::filesystem;

SourceCatalog::SourceCatalog(fs::path root,
                             config::LanguageTable language_table,
                             std::vector<std::string> ignore_patterns)
    : root_(std::move(root)),
      language_table_(std::move(language_table)),
      ignore_(ignore_patterns)
{
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw RootNotFoundError(root_);
    }

    push_directory(root_);
}

std::optional<SourceFile> SourceCatalog::next() {
    while (!pending_.empty()) {
        DirectoryFrame &frame = pending_.back();
        if (frame.position >= frame.entries.size()) {
            pending_.pop_back();
            continue;
        }

        fs::path entry = frame.entries[frame.position++];
        if (is_ignored(entry)) {
            spdlog::debug("Ignoring {}", entry.string());
            continue;
        }

        std::error_code ec;
        fs::file_status status = fs::symlink_status(entry, ec);
        if (ec) {
            spdlog::debug("Cannot stat {}: {}", entry.string(), ec.message());
            continue;
        }

        if (fs::is_directory(status)) {
            // frame is invalidated by the push below
            push_directory(entry);
            continue;
        }

        if (fs::is_symlink(status)) {
            // File symlinks are followed, directory symlinks are not.
            if (!fs::is_regular_file(entry, ec)) {
                continue;
            }
        } else if (!fs::is_regular_file(status)) {
            continue;
        }

        if (auto file = accept_file(entry)) {
            return file;
        }
    }
    return std::nullopt;
}

std::optional<std::string> SourceCatalog::language_for(const fs::path &file_path) const {
    auto it = language_table_.find(utils::extension_of(file_path));
    if (it == language_table_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SourceCatalog::push_directory(const fs::path &directory) {
    DirectoryFrame frame;

    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot list directory {}: {}", directory.string(), ec.message());
        return;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Error while listing {}: {}", directory.string(), ec.message());
            break;
        }
        frame.entries.push_back(it->path());
    }

    std::sort(frame.entries.begin(), frame.entries.end());
    pending_.push_back(std::move(frame));
}

bool SourceCatalog::is_ignored(const fs::path &path) const {
    if (ignore_.empty()) {
        return false;
    }
    return ignore_.matches(utils::relative_generic_path(root_, path));
}

std::optional<SourceFile> SourceCatalog::accept_file(const fs::path &path) const {
    auto language = language_for(path);
    if (!language) {
        return std::nullopt;
    }

    if (!utils::is_readable_file(path)) {
        spdlog::debug("Skipping unreadable file {}", path.string());
        return std::nullopt;
    }
    if (utils::looks_binary(path)) {
        spdlog::debug("Skipping binary file {}", path.string());
        return std::nullopt;
    }

    return SourceFile{path, *language};
}

} // namespace depgraph::catalog
