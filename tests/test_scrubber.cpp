#include <catch2/catch_test_macros.hpp>

#include "nomoji/emoji/scrubber.hpp"

#include <string>
#include <vector>

using nomoji::emoji::find_sequences;
using nomoji::emoji::scrub;

namespace {

bool is_subsequence(const std::u32string& needle, const std::u32string& haystack) {
    size_t matched = 0;
    for (char32_t scalar : haystack) {
        if (matched < needle.size() && needle[matched] == scalar) {
            ++matched;
        }
    }
    return matched == needle.size();
}

const std::vector<std::u32string>& samples() {
    static const std::vector<std::u32string> inputs = {
        U"Hello \U0001F600 World \U0001F30D",
        U"flag \U0001F1FA\U0001F1F8 here",
        U"wave \U0001F44B\U0001F3FD bye",
        U"\U0001F468\u200D\U0001F469\u200D\U0001F467 family",
        U"#\U0001F600\u20E3 keycap split",
        U"1\uFE0F\u20E3 \u2764\uFE0F \U0001F1EC",
        U"\U0001F600\U0001F3FD orphan after plain emoji",
        U"\u200D\uFE0F\U0001F3FB lonely",
        U"\U0001F600\u200D\U0001F600\u200D\U0001F600\u200D\U0001F600\u200D\U0001F600\u200D\U0001F600",
    };
    return inputs;
}

}

TEST_CASE("scrub removes single-scalar emoji") {
    const auto result = scrub(U"Hello \U0001F600 World \U0001F30D");
    REQUIRE(result.output == U"Hello  World ");
    REQUIRE(result.removed_count == 2);
}

TEST_CASE("scrub removes a flag as one sequence") {
    const auto result = scrub(U"flag \U0001F1FA\U0001F1F8 here");
    REQUIRE(result.output == U"flag  here");
    REQUIRE(result.removed_count == 1);
}

TEST_CASE("scrub removes a skin-toned emoji as one sequence") {
    const auto result = scrub(U"wave \U0001F44B\U0001F3FD bye");
    REQUIRE(result.output == U"wave  bye");
    REQUIRE(result.removed_count == 1);
}

TEST_CASE("scrub leaves accented text alone") {
    const std::u32string input = U"caf\u00E9 r\u00E9sum\u00E9";
    const auto result = scrub(input);
    REQUIRE(result.output == input);
    REQUIRE(result.removed_count == 0);
}

TEST_CASE("scrub removes legal symbols individually") {
    const auto result = scrub(U"\u00A9 \u00AE \u2122");
    REQUIRE(result.output == U"  ");
    REQUIRE(result.removed_count == 3);
}

TEST_CASE("scrub of empty input is empty") {
    const auto result = scrub(U"");
    REQUIRE(result.output.empty());
    REQUIRE(result.removed_count == 0);
}

TEST_CASE("scrub counts sequences rather than scalar values") {
    const std::u32string flags =
        U"Flags: \U0001F1FA\U0001F1F8\U0001F1EC\U0001F1E7\U0001F1EF\U0001F1F5"
        U"\U0001F1EB\U0001F1F7\U0001F1E9\U0001F1EA";
    const auto result = scrub(flags);
    REQUIRE(result.output == U"Flags: ");
    REQUIRE(result.removed_count == 5);
    REQUIRE(result.removed_count != flags.size() - result.output.size());

    const auto tones = scrub(U"People: \U0001F44B\U0001F3FB\U0001F44B\U0001F3FC\U0001F44B\U0001F3FD"
                             U"\U0001F44B\U0001F3FE\U0001F44B\U0001F3FF");
    REQUIRE(tones.output == U"People: ");
    REQUIRE(tones.removed_count == 5);
}

TEST_CASE("scrub preserves whitespace and control characters") {
    const auto result = scrub(U"Line 1 \U0001F600\nLine 2 \U0001F30D\r\n\tLine 4 \U0001F525");
    REQUIRE(result.output == U"Line 1 \nLine 2 \r\n\tLine 4 ");
    REQUIRE(result.removed_count == 3);
}

TEST_CASE("scrub preserves non-emoji scripts and symbols") {
    const std::vector<std::u32string> inputs = {
        U"na\u00EFve \u00C5ngstr\u00F6m \u0141\u00F3d\u017A",
        U"\u65E5\u672C\u8A9E \u4E2D\u6587 \uD55C\uAD6D\uC5B4",
        U"\u0645\u0631\u062D\u0628\u0627 \u0628\u0627\u0644\u0639\u0627\u0644\u0645",
        U"\u05E9\u05DC\u05D5\u05DD \u05E2\u05D5\u05DC\u05DD",
        U"\u041F\u0440\u0438\u0432\u0435\u0442, \u043C\u0438\u0440",
        U"\u2200x\u2208\u211D: \u2211 \u222B \u221A \u221E \u2248 \u2260 \u2264 \u2265 \u00B1 \u00D7",
    };
    for (const auto& input : inputs) {
        const auto result = scrub(input);
        REQUIRE(result.output == input);
        REQUIRE(result.removed_count == 0);
    }
}

TEST_CASE("scrub keeps orphan modifiers, selectors and joiners") {
    const std::u32string input = U"a\U0001F3FDb\uFE0Fc\u200Dd";
    const auto result = scrub(input);
    REQUIRE(result.output == input);
    REQUIRE(result.removed_count == 0);
}

TEST_CASE("scrub keeps keycap digits and symbols") {
    const auto result = scrub(U"Press 1\uFE0F\u20E3 or #\uFE0F\u20E3");
    REQUIRE(result.output == U"Press 1\uFE0F or #\uFE0F");
    REQUIRE(result.removed_count == 2);

    const auto again = scrub(result.output);
    REQUIRE(again.output == result.output);
    REQUIRE(again.removed_count == 0);
}

TEST_CASE("scrub removes emoji-presentation arrows") {
    const auto result = scrub(U"\u2194\uFE0F \u21A9\uFE0F");
    REQUIRE(result.output == U" ");
    REQUIRE(result.removed_count == 2);
}

TEST_CASE("scrub output is a subsequence of its input") {
    for (const auto& input : samples()) {
        REQUIRE(is_subsequence(scrub(input).output, input));
    }
}

TEST_CASE("scrub is idempotent") {
    for (const auto& input : samples()) {
        const auto first = scrub(input);
        const auto second = scrub(first.output);
        REQUIRE(second.output == first.output);
        REQUIRE(second.removed_count == 0);
    }
}

TEST_CASE("find_sequences agrees with the scrub count") {
    for (const auto& input : samples()) {
        REQUIRE(find_sequences(input).size() == scrub(input).removed_count);
    }

    const auto sequences = find_sequences(U"ok \U0001F44B\U0001F3FD \U0001F1FA\U0001F1F8");
    REQUIRE(sequences.size() == 2);
    REQUIRE(sequences[0].start == 3);
    REQUIRE(sequences[0].length == 2);
    REQUIRE(sequences[0].kind == nomoji::emoji::SequenceKind::SkinTone);
    REQUIRE(sequences[1].start == 6);
    REQUIRE(sequences[1].kind == nomoji::emoji::SequenceKind::Flag);
}
