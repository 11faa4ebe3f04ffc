#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "nomoji/emoji/classifier.hpp"

namespace nomoji {
namespace emoji {

struct EmojiSequence {
    std::size_t start = 0;
    std::size_t length = 0;
    SequenceKind kind = SequenceKind::Simple;
};

struct ScrubResult {
    std::u32string output;
    std::size_t removed_count = 0;
};

// Removes every emoji sequence from `input`. The count is one per sequence,
// not per scalar value.
ScrubResult scrub(std::u32string_view input);

std::vector<EmojiSequence> find_sequences(std::u32string_view input);

}
}
