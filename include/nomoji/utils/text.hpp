#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nomoji::utils {

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(std::size_t offset);

    std::size_t offset() const { return offset_; }

private:
    std::size_t offset_;
};

struct CleanedText {
    std::string text;
    std::size_t removed_count = 0;
};

// Strict: throws DecodeError on truncated, overlong, surrogate or
// out-of-range sequences.
std::u32string decode_utf8(std::string_view bytes);
std::string encode_utf8(std::u32string_view scalars);

CleanedText remove_emojis(std::string_view text);

}
