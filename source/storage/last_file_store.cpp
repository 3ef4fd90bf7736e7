#include "storage/last_file_store.hpp"
#include "utils/debug_log.hpp"
#include "utils/path_text.hpp"

#include <filesystem>
#include <system_error>

namespace last_file_store {

// UTF-8 encodings of the Unicode White_Space code points.
static const std::string WHITESPACE_SEQUENCES[] = {
    "\t", "\n", "\v", "\f", "\r", " ",
    "\xC2\x85", "\xC2\xA0", "\xE1\x9A\x80",
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85",
    "\xE2\x80\x86", "\xE2\x80\x87", "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",
    "\xE2\x80\xA8", "\xE2\x80\xA9", "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80",
};

// Byte length of the whitespace sequence starting at offset, or 0.
static std::size_t whitespace_at(const std::string &value, std::size_t offset) {
    for (const auto &sequence : WHITESPACE_SEQUENCES) {
        if (value.compare(offset, sequence.size(), sequence) == 0) {
            return sequence.size();
        }
    }
    return 0;
}

// Byte length of the whitespace sequence ending at end, or 0.
static std::size_t whitespace_before(const std::string &value, std::size_t end) {
    for (const auto &sequence : WHITESPACE_SEQUENCES) {
        if (end >= sequence.size() && value.compare(end - sequence.size(), sequence.size(), sequence) == 0) {
            return sequence.size();
        }
    }
    return 0;
}

std::string trim(const std::string &value) {
    std::size_t begin = 0;
    while (begin < value.size()) {
        std::size_t length = whitespace_at(value, begin);
        if (length == 0) {
            break;
        }
        begin += length;
    }

    std::size_t end = value.size();
    while (end > begin) {
        std::size_t length = whitespace_before(value, end);
        if (length == 0) {
            break;
        }
        end -= length;
    }
    return value.substr(begin, end - begin);
}

LoadResult load(const platform::DirectoryResult &data_directory) {
    LoadResult result;

    if (!data_directory.success) {
        result.error_message = "Failed to get app data dir: " + data_directory.error_message;
        return result;
    }

    const std::filesystem::path marker_path = std::filesystem::path(data_directory.path) / MARKER_FILE_NAME;

    std::error_code exists_error;
    if (!std::filesystem::exists(marker_path, exists_error)) {
        // Nothing saved yet is a normal state, not an error.
        debug_log::log("No last file marker at " + marker_path.string());
        result.success = true;
        return result;
    }

    std::string contents;
    std::string read_error;
    if (!platform::read_file_contents(marker_path.string(), contents, read_error)) {
        result.error_message = "Failed to read last file path: " + read_error;
        return result;
    }

    if (!path_text::is_valid_utf8(contents)) {
        result.error_message = "Failed to read last file path: stream did not contain valid UTF-8";
        return result;
    }

    result.success = true;
    result.path = trim(contents);
    return result;
}

SaveResult save(const platform::DirectoryResult &data_directory, const std::string &path) {
    SaveResult result;

    if (!data_directory.success) {
        result.error_message = "Failed to get app data dir: " + data_directory.error_message;
        return result;
    }

    const std::filesystem::path directory(data_directory.path);

    std::error_code create_error;
    std::filesystem::create_directories(directory, create_error);
    if (create_error) {
        result.error_message = "Failed to create app data dir: " + create_error.message();
        return result;
    }

    const std::filesystem::path marker_path = directory / MARKER_FILE_NAME;
    std::string write_error;
    if (!platform::write_file_contents(marker_path.string(), path, write_error)) {
        result.error_message = "Failed to save last file path: " + write_error;
        return result;
    }

    debug_log::log("Saved last file path to " + marker_path.string());
    result.success = true;
    return result;
}

} // namespace last_file_store
