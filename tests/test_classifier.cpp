#include <catch2/catch_test_macros.hpp>

#include "nomoji/emoji/classifier.hpp"

#include <stdexcept>
#include <string>

using nomoji::emoji::classify;
using nomoji::emoji::SequenceKind;

TEST_CASE("classify treats ordinary text as a single non-emoji scalar") {
    const std::u32string input = U"a\u00E9\u65E5";
    for (size_t i = 0; i < input.size(); ++i) {
        const auto result = classify(input, i);
        REQUIRE_FALSE(result.is_emoji);
        REQUIRE(result.consumed == 1);
        REQUIRE(result.kind == SequenceKind::Text);
    }
}

TEST_CASE("classify matches single-scalar emoji") {
    const auto result = classify(U"\U0001F600!", 0);
    REQUIRE(result.is_emoji);
    REQUIRE(result.consumed == 1);
    REQUIRE(result.kind == SequenceKind::Simple);

    REQUIRE(classify(U"\u00A9", 0).is_emoji);
    REQUIRE(classify(U"\u00AE", 0).is_emoji);
    REQUIRE(classify(U"\u2122", 0).is_emoji);
    REQUIRE(classify(U"\U0001F680", 0).is_emoji);
    REQUIRE(classify(U"\U0001F7E5", 0).is_emoji);
    REQUIRE(classify(U"\u2705", 0).is_emoji);
}

TEST_CASE("classify pairs regional indicators into one flag") {
    const std::u32string input = U"\U0001F1FA\U0001F1F8\U0001F1EC";
    const auto flag = classify(input, 0);
    REQUIRE(flag.is_emoji);
    REQUIRE(flag.consumed == 2);
    REQUIRE(flag.kind == SequenceKind::Flag);

    const auto lone = classify(input, 2);
    REQUIRE(lone.is_emoji);
    REQUIRE(lone.consumed == 1);
}

TEST_CASE("classify attaches a skin-tone modifier to a modifier base") {
    const auto result = classify(U"\U0001F44B\U0001F3FD bye", 0);
    REQUIRE(result.is_emoji);
    REQUIRE(result.consumed == 2);
    REQUIRE(result.kind == SequenceKind::SkinTone);
}

TEST_CASE("classify does not attach a skin-tone modifier to other emoji") {
    const std::u32string input = U"\U0001F600\U0001F3FD";
    REQUIRE(classify(input, 0).consumed == 1);
    REQUIRE_FALSE(classify(input, 1).is_emoji);
}

TEST_CASE("classify consumes a trailing variation selector") {
    const auto result = classify(U"\u2764\uFE0F", 0);
    REQUIRE(result.is_emoji);
    REQUIRE(result.consumed == 2);
    REQUIRE(result.kind == SequenceKind::VariationSelector);
}

TEST_CASE("classify joins zero-width-joiner composites greedily") {
    SECTION("family") {
        const auto result =
            classify(U"\U0001F468\u200D\U0001F469\u200D\U0001F467\u200D\U0001F466", 0);
        REQUIRE(result.is_emoji);
        REQUIRE(result.consumed == 7);
        REQUIRE(result.kind == SequenceKind::ZwjComposite);
    }
    SECTION("modifier before the joiner") {
        const auto result = classify(U"\U0001F469\U0001F3FD\u200D\U0001F4BB", 0);
        REQUIRE(result.consumed == 4);
        REQUIRE(result.kind == SequenceKind::ZwjComposite);
    }
    SECTION("variation selectors on both sides") {
        const auto result = classify(U"\U0001F3CB\uFE0F\u200D\u2640\uFE0F", 0);
        REQUIRE(result.consumed == 5);
    }
    SECTION("kiss with two skin tones fills the bound exactly") {
        const std::u32string kiss =
            U"\U0001F469\U0001F3FD\u200D\u2764\uFE0F\u200D\U0001F48B\u200D\U0001F468\U0001F3FC";
        REQUIRE(kiss.size() == nomoji::emoji::kMaxSequenceLength);
        REQUIRE(classify(kiss, 0).consumed == kiss.size());
    }
}

TEST_CASE("classify stops a joiner run at the length bound") {
    std::u32string input = U"\U0001F600";
    for (int i = 0; i < 5; ++i) {
        input += U"\u200D\U0001F600";
    }
    const auto result = classify(input, 0);
    REQUIRE(result.consumed <= nomoji::emoji::kMaxSequenceLength);
    REQUIRE(result.consumed == 9);
    REQUIRE_FALSE(classify(input, 9).is_emoji);
}

TEST_CASE("classify leaves a joiner that is not followed by emoji") {
    const std::u32string input = U"\U0001F600\u200Da";
    REQUIRE(classify(input, 0).consumed == 1);
    REQUIRE_FALSE(classify(input, 1).is_emoji);
}

TEST_CASE("classify treats orphan modifiers as text") {
    for (const std::u32string input : {U"\U0001F3FB", U"\uFE0F", U"\u200D", U"\U000E0067"}) {
        const auto result = classify(input, 0);
        REQUIRE_FALSE(result.is_emoji);
        REQUIRE(result.consumed == 1);
    }
}

TEST_CASE("classify keeps keycap bases as text") {
    for (const std::u32string input : {U"1\uFE0F\u20E3", U"#\u20E3", U"*\uFE0F"}) {
        const auto result = classify(input, 0);
        REQUIRE_FALSE(result.is_emoji);
        REQUIRE(result.consumed == 1);
    }
    REQUIRE_FALSE(classify(U"1", 0).is_emoji);

    const auto mark = classify(U"\u20E3", 0);
    REQUIRE(mark.is_emoji);
    REQUIRE(mark.consumed == 1);
}

TEST_CASE("classify recognizes emoji-presentation arrows") {
    for (const std::u32string input : {U"\u2194\uFE0F", U"\u2199\uFE0F", U"\u21A9\uFE0F", U"\u21AA"}) {
        REQUIRE(classify(input, 0).is_emoji);
    }
    REQUIRE(classify(U"\u2194\uFE0F", 0).consumed == 2);
    REQUIRE_FALSE(classify(U"\u2190", 0).is_emoji);
    REQUIRE_FALSE(classify(U"\u219A", 0).is_emoji);
}

TEST_CASE("classify recognizes subdivision flag tag sequences") {
    const std::u32string england =
        U"\U0001F3F4\U000E0067\U000E0062\U000E0065\U000E006E\U000E0067\U000E007F";
    const auto result = classify(england, 0);
    REQUIRE(result.consumed == 7);
    REQUIRE(result.kind == SequenceKind::Tag);

    const std::u32string unterminated = U"\U0001F3F4\U000E0067";
    REQUIRE(classify(unterminated, 0).consumed == 1);
    REQUIRE_FALSE(classify(unterminated, 1).is_emoji);
}

TEST_CASE("classify never consumes past the end of input") {
    const std::u32string input = U"x\U0001F1FA";
    const auto result = classify(input, 1);
    REQUIRE(result.consumed == 1);
    REQUIRE_THROWS_AS(classify(input, 2), std::out_of_range);
    REQUIRE_THROWS_AS(classify(U"", 0), std::out_of_range);
}

TEST_CASE("range predicates separate bases from modifiers") {
    using namespace nomoji::emoji;
    REQUIRE(is_emoji_base(0x1F600));
    REQUIRE_FALSE(is_emoji_base(0x1F3FB));
    REQUIRE_FALSE(is_emoji_base(0x1F1E6));
    REQUIRE_FALSE(is_emoji_base(0x2211));
    REQUIRE(is_modifier_base(0x1F44B));
    REQUIRE_FALSE(is_modifier_base(0x1F600));
    REQUIRE(is_regional_indicator(0x1F1FF));
    REQUIRE(is_variation_selector(0xFE0E));
    REQUIRE(std::string(to_string(SequenceKind::ZwjComposite)) == "zwj_composite");
}
