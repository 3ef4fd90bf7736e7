#include "utils/path_text.hpp"

#include <cstddef>

namespace path_text {

namespace {

const char kReplacementCharacter[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at offset, or 0 if the bytes
// there do not form one. Rejects overlong encodings and surrogates.
std::size_t sequence_length_at(const std::string &text, std::size_t offset) {
    const auto byte_at = [&text](std::size_t index) {
        return static_cast<unsigned char>(text[index]);
    };

    unsigned char lead = byte_at(offset);
    std::size_t length = 0;
    unsigned char second_minimum = 0x80u;
    unsigned char second_maximum = 0xBFu;

    if (lead < 0x80u) {
        return 1;
    } else if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead >= 0xE0u && lead <= 0xEFu) {
        length = 3;
        if (lead == 0xE0u) {
            second_minimum = 0xA0u;
        } else if (lead == 0xEDu) {
            second_maximum = 0x9Fu;
        }
    } else if (lead >= 0xF0u && lead <= 0xF4u) {
        length = 4;
        if (lead == 0xF0u) {
            second_minimum = 0x90u;
        } else if (lead == 0xF4u) {
            second_maximum = 0x8Fu;
        }
    } else {
        return 0;
    }

    if (offset + length > text.size()) {
        return 0;
    }

    unsigned char second = byte_at(offset + 1);
    if (second < second_minimum || second > second_maximum) {
        return 0;
    }
    for (std::size_t index = 2; index < length; ++index) {
        if ((byte_at(offset + index) & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

} // namespace

bool is_valid_utf8(const std::string &text) {
    std::size_t offset = 0;
    while (offset < text.size()) {
        std::size_t length = sequence_length_at(text, offset);
        if (length == 0) {
            return false;
        }
        offset += length;
    }
    return true;
}

std::string to_lossy_utf8(const std::string &raw) {
    std::string result;
    result.reserve(raw.size());

    std::size_t offset = 0;
    while (offset < raw.size()) {
        std::size_t length = sequence_length_at(raw, offset);
        if (length == 0) {
            result += kReplacementCharacter;
            ++offset;
            continue;
        }
        result.append(raw, offset, length);
        offset += length;
    }
    return result;
}

std::string from_path(const std::filesystem::path &path) {
    return to_lossy_utf8(path.native());
}

} // namespace path_text
