#include "nomoji/utils/text.hpp"

#include <cstdint>

#include "nomoji/emoji/scrubber.hpp"

namespace nomoji::utils {

namespace {

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

bool decode_scalar(std::string_view text, size_t index, uint32_t& codepoint, size_t& length) {
    const auto byte = static_cast<unsigned char>(text[index]);
    if (byte < 0x80) {
        codepoint = byte;
        length = 1;
        return true;
    }
    if ((byte & 0xE0) == 0xC0 && index + 1 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        if (!is_continuation(b1)) {
            return false;
        }
        codepoint = ((byte & 0x1F) << 6) | (b1 & 0x3F);
        length = 2;
        return codepoint >= 0x80;
    }
    if ((byte & 0xF0) == 0xE0 && index + 2 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        const auto b2 = static_cast<unsigned char>(text[index + 2]);
        if (!is_continuation(b1) || !is_continuation(b2)) {
            return false;
        }
        codepoint = ((byte & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F);
        length = 3;
        return codepoint >= 0x800 && (codepoint < 0xD800 || codepoint > 0xDFFF);
    }
    if ((byte & 0xF8) == 0xF0 && index + 3 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        const auto b2 = static_cast<unsigned char>(text[index + 2]);
        const auto b3 = static_cast<unsigned char>(text[index + 3]);
        if (!is_continuation(b1) || !is_continuation(b2) || !is_continuation(b3)) {
            return false;
        }
        codepoint = ((byte & 0x07) << 18) |
                    ((b1 & 0x3F) << 12) |
                    ((b2 & 0x3F) << 6) |
                    (b3 & 0x3F);
        length = 4;
        return codepoint >= 0x10000 && codepoint <= 0x10FFFF;
    }
    return false;
}

}

DecodeError::DecodeError(std::size_t offset)
    : std::runtime_error("invalid UTF-8 sequence at byte " + std::to_string(offset)),
      offset_(offset) {}

std::u32string decode_utf8(std::string_view bytes) {
    std::u32string scalars;
    scalars.reserve(bytes.size());
    for (size_t i = 0; i < bytes.size();) {
        uint32_t codepoint = 0;
        size_t length = 1;
        if (!decode_scalar(bytes, i, codepoint, length)) {
            throw DecodeError(i);
        }
        scalars.push_back(static_cast<char32_t>(codepoint));
        i += length;
    }
    return scalars;
}

std::string encode_utf8(std::u32string_view scalars) {
    std::string bytes;
    bytes.reserve(scalars.size());
    for (char32_t scalar : scalars) {
        const auto cp = static_cast<uint32_t>(scalar);
        if (cp < 0x80) {
            bytes.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            bytes.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            bytes.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            bytes.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            bytes.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            bytes.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            bytes.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            bytes.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            bytes.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            bytes.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return bytes;
}

CleanedText remove_emojis(std::string_view text) {
    const auto scrubbed = emoji::scrub(decode_utf8(text));
    return {encode_utf8(scrubbed.output), scrubbed.removed_count};
}

}
