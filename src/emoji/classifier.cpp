#include "nomoji/emoji/classifier.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace nomoji::emoji {

namespace {

struct CodepointRange {
    char32_t first;
    char32_t last;
};

// Sorted, non-overlapping. Skin-tone modifiers (U+1F3FB..U+1F3FF) and
// regional indicators (U+1F1E6..U+1F1FF) are cut out of their blocks and
// handled by the sequence rules.
constexpr CodepointRange kEmojiBaseRanges[] = {
    {0x00A9, 0x00A9},   {0x00AE, 0x00AE},   {0x203C, 0x203C},   {0x2049, 0x2049},
    {0x2122, 0x2122},   {0x2139, 0x2139},   {0x2194, 0x2199},   {0x21A9, 0x21AA},
    {0x231A, 0x231B},   {0x2328, 0x2328},   {0x23CF, 0x23CF},   {0x23E9, 0x23F3},
    {0x23F8, 0x23FA},   {0x24C2, 0x24C2},   {0x25AA, 0x25AB},   {0x25B6, 0x25B6},
    {0x25C0, 0x25C0},   {0x25FB, 0x25FE},   {0x2600, 0x26FF},   {0x2700, 0x27BF},
    {0x2934, 0x2935},   {0x2B05, 0x2B07},   {0x2B1B, 0x2B1C},   {0x2B50, 0x2B50},
    {0x2B55, 0x2B55},   {0x3030, 0x3030},   {0x303D, 0x303D},   {0x3297, 0x3297},
    {0x3299, 0x3299},   {0x1F004, 0x1F004}, {0x1F0CF, 0x1F0CF}, {0x1F100, 0x1F1E5},
    {0x1F200, 0x1F2FF}, {0x1F300, 0x1F3FA}, {0x1F400, 0x1F64F}, {0x1F680, 0x1F6FF},
    {0x1F780, 0x1F7FF}, {0x1F900, 0x1FAFF},
};

constexpr CodepointRange kModifierBaseRanges[] = {
    {0x261D, 0x261D},   {0x26F9, 0x26F9},   {0x270A, 0x270D},   {0x1F385, 0x1F385},
    {0x1F3C2, 0x1F3C4}, {0x1F3C7, 0x1F3C7}, {0x1F3CA, 0x1F3CC}, {0x1F442, 0x1F443},
    {0x1F446, 0x1F450}, {0x1F466, 0x1F478}, {0x1F47C, 0x1F47C}, {0x1F481, 0x1F483},
    {0x1F485, 0x1F487}, {0x1F48F, 0x1F48F}, {0x1F491, 0x1F491}, {0x1F4AA, 0x1F4AA},
    {0x1F574, 0x1F575}, {0x1F57A, 0x1F57A}, {0x1F590, 0x1F590}, {0x1F595, 0x1F596},
    {0x1F645, 0x1F647}, {0x1F64B, 0x1F64F}, {0x1F6A3, 0x1F6A3}, {0x1F6B4, 0x1F6B6},
    {0x1F6C0, 0x1F6C0}, {0x1F6CC, 0x1F6CC}, {0x1F90C, 0x1F90C}, {0x1F90F, 0x1F90F},
    {0x1F918, 0x1F91F}, {0x1F926, 0x1F926}, {0x1F930, 0x1F939}, {0x1F93C, 0x1F93E},
    {0x1F977, 0x1F977}, {0x1F9B5, 0x1F9B6}, {0x1F9B8, 0x1F9B9}, {0x1F9BB, 0x1F9BB},
    {0x1F9CD, 0x1F9CF}, {0x1F9D1, 0x1F9DD}, {0x1FAC3, 0x1FAC5}, {0x1FAF0, 0x1FAF8},
};

template <std::size_t N>
bool in_ranges(const CodepointRange (&table)[N], char32_t scalar) {
    const auto it = std::upper_bound(std::begin(table), std::end(table), scalar,
                                     [](char32_t value, const CodepointRange& range) {
                                         return value < range.first;
                                     });
    if (it == std::begin(table)) {
        return false;
    }
    return scalar <= std::prev(it)->last;
}

// Length of one emoji element starting at `start`: the base plus at most one
// skin-tone modifier, variation selector or terminated tag run. Never reads
// at or past `end`.
std::size_t element_length(std::u32string_view input, std::size_t start, std::size_t end,
                           SequenceKind& kind) {
    kind = SequenceKind::Simple;
    const std::size_t next = start + 1;
    if (next >= end) {
        return 1;
    }
    const char32_t base = input[start];
    const char32_t follower = input[next];

    if (is_modifier_base(base) && is_skin_tone_modifier(follower)) {
        kind = SequenceKind::SkinTone;
        return 2;
    }
    if (is_variation_selector(follower)) {
        kind = SequenceKind::VariationSelector;
        return 2;
    }
    if (is_tag_spec(follower)) {
        std::size_t cursor = next;
        while (cursor < end && is_tag_spec(input[cursor])) {
            ++cursor;
        }
        if (cursor < end && input[cursor] == kCancelTag) {
            kind = SequenceKind::Tag;
            return cursor + 1 - start;
        }
    }
    return 1;
}

}

bool is_emoji_base(char32_t scalar) {
    return in_ranges(kEmojiBaseRanges, scalar);
}

bool is_modifier_base(char32_t scalar) {
    return in_ranges(kModifierBaseRanges, scalar);
}

bool is_regional_indicator(char32_t scalar) {
    return scalar >= 0x1F1E6 && scalar <= 0x1F1FF;
}

bool is_skin_tone_modifier(char32_t scalar) {
    return scalar >= 0x1F3FB && scalar <= 0x1F3FF;
}

bool is_variation_selector(char32_t scalar) {
    return scalar >= 0xFE00 && scalar <= 0xFE0F;
}

bool is_zero_width_joiner(char32_t scalar) {
    return scalar == kZeroWidthJoiner;
}

bool is_tag_spec(char32_t scalar) {
    return scalar >= 0xE0020 && scalar <= 0xE007E;
}

Classification classify(std::u32string_view input, std::size_t position) {
    if (position >= input.size()) {
        throw std::out_of_range("classify position is past the end of input");
    }
    const char32_t scalar = input[position];
    const std::size_t end = position + std::min(kMaxSequenceLength, input.size() - position);

    if (is_regional_indicator(scalar)) {
        if (position + 1 < end && is_regional_indicator(input[position + 1])) {
            return {true, 2, SequenceKind::Flag};
        }
        return {true, 1, SequenceKind::Simple};
    }
    // The keycap base (0-9, # or *) stays as text; only the enclosing mark goes.
    if (scalar == kCombiningEnclosingKeycap) {
        return {true, 1, SequenceKind::Simple};
    }
    if (!is_emoji_base(scalar)) {
        return {};
    }

    Classification result;
    result.is_emoji = true;
    std::size_t cursor = position + element_length(input, position, end, result.kind);

    while (cursor + 1 < end && is_zero_width_joiner(input[cursor]) &&
           is_emoji_base(input[cursor + 1])) {
        SequenceKind joined = SequenceKind::Simple;
        cursor += 1 + element_length(input, cursor + 1, end, joined);
        result.kind = SequenceKind::ZwjComposite;
    }

    result.consumed = cursor - position;
    return result;
}

const char* to_string(SequenceKind kind) {
    switch (kind) {
        case SequenceKind::Text:
            return "text";
        case SequenceKind::Simple:
            return "simple";
        case SequenceKind::VariationSelector:
            return "variation_selector";
        case SequenceKind::SkinTone:
            return "skin_tone";
        case SequenceKind::Flag:
            return "flag";
        case SequenceKind::Tag:
            return "tag";
        case SequenceKind::ZwjComposite:
            return "zwj_composite";
    }
    return "unknown";
}

}
