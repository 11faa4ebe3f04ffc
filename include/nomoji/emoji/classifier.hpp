#pragma once

#include <cstddef>
#include <string_view>

namespace nomoji {
namespace emoji {

// Upper bound on scalar values in one matched sequence. Covers the longest
// RGI ZWJ sequences (couple/kiss with two skin tones).
constexpr std::size_t kMaxSequenceLength = 10;

constexpr char32_t kZeroWidthJoiner = 0x200D;
constexpr char32_t kCombiningEnclosingKeycap = 0x20E3;
constexpr char32_t kCancelTag = 0xE007F;

enum class SequenceKind {
    Text,
    Simple,
    VariationSelector,
    SkinTone,
    Flag,
    Tag,
    ZwjComposite,
};

struct Classification {
    bool is_emoji = false;
    std::size_t consumed = 1;
    SequenceKind kind = SequenceKind::Text;
};

bool is_emoji_base(char32_t scalar);
bool is_modifier_base(char32_t scalar);
bool is_regional_indicator(char32_t scalar);
bool is_skin_tone_modifier(char32_t scalar);
bool is_variation_selector(char32_t scalar);
bool is_zero_width_joiner(char32_t scalar);
bool is_tag_spec(char32_t scalar);

// Decides whether an emoji sequence starts at `position` and how many scalar
// values it spans. Throws std::out_of_range when `position` is past the end.
Classification classify(std::u32string_view input, std::size_t position);

const char* to_string(SequenceKind kind);

}
}
