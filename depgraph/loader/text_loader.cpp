#include "loader/text_loader.hpp"
#include "utils/encoding.hpp"
#include "utils/filesystem.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace depgraph::loader {

std::string to_string(Encoding encoding) {
    switch (encoding) {
        case Encoding::utf8:   return "utf-8";
        case Encoding::latin1: return "latin-1";
    }
    return "unknown";
}

LoadedText TextLoader::load(const std::filesystem::path &file_path) const {
    std::string bytes;
    try {
        bytes = utils::read_file_bytes(file_path);
    } catch (const std::system_error &e) {
        throw ReadFailure(file_path, e.code().message());
    }

    try {
        return decode(std::move(bytes));
    } catch (const ReadFailure &e) {
        throw ReadFailure(file_path, e.cause());
    }
}

LoadedText TextLoader::decode(std::string bytes) const {
    std::string candidate = bytes;
    if (try_decode(primary_, candidate)) {
        return LoadedText{std::move(candidate), primary_};
    }

    spdlog::debug("Content is not {}, retrying as {}", to_string(primary_), to_string(fallback_));
    if (try_decode(fallback_, bytes)) {
        return LoadedText{std::move(bytes), fallback_};
    }

    throw ReadFailure({}, "content is neither " + to_string(primary_) + " nor " + to_string(fallback_));
}

bool TextLoader::try_decode(Encoding encoding, std::string &bytes) {
    switch (encoding) {
        case Encoding::utf8:
            if (!utils::is_valid_utf8(bytes)) {
                return false;
            }
            if (utils::has_utf8_bom(bytes)) {
                bytes.erase(0, 3);
            }
            return true;
        case Encoding::latin1:
            bytes = utils::latin1_to_utf8(bytes);
            return true;
    }
    return false;
}

} // namespace depgraph::loader
