#include "nomoji/emoji/scrubber.hpp"

namespace nomoji::emoji {

ScrubResult scrub(std::u32string_view input) {
    ScrubResult result;
    result.output.reserve(input.size());
    std::size_t cursor = 0;
    while (cursor < input.size()) {
        const auto match = classify(input, cursor);
        if (match.is_emoji) {
            cursor += match.consumed;
            ++result.removed_count;
            continue;
        }
        result.output.push_back(input[cursor]);
        ++cursor;
    }
    return result;
}

std::vector<EmojiSequence> find_sequences(std::u32string_view input) {
    std::vector<EmojiSequence> sequences;
    std::size_t cursor = 0;
    while (cursor < input.size()) {
        const auto match = classify(input, cursor);
        if (!match.is_emoji) {
            ++cursor;
            continue;
        }
        sequences.push_back({cursor, match.consumed, match.kind});
        cursor += match.consumed;
    }
    return sequences;
}

}
