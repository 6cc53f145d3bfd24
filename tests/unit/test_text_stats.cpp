#include <gtest/gtest.h>
#include "text/text_stats.hpp"

namespace {

using namespace docgate::text;

TEST(TextStatsTest, CountsWordsAcrossWhitespaceRuns) {
    EXPECT_EQ(count_words(""), 0u);
    EXPECT_EQ(count_words("   \n\t "), 0u);
    EXPECT_EQ(count_words("one  two\nthree\tfour"), 4u);
}

TEST(TextStatsTest, CodePointsIgnoreContinuationBytes) {
    EXPECT_EQ(count_code_points("abc"), 3u);
    EXPECT_EQ(count_code_points("h\xC3\xA9llo"), 5u);
    EXPECT_EQ(count_code_points("\xE2\x82\xAC"), 1u);
}

TEST(TextStatsTest, ByteOffsetClampsToText) {
    const std::string text = "\xC3\xA9t\xC3\xA9";
    EXPECT_EQ(byte_offset_of(text, 0), 0u);
    EXPECT_EQ(byte_offset_of(text, 1), 2u);
    EXPECT_EQ(byte_offset_of(text, 2), 3u);
    EXPECT_EQ(byte_offset_of(text, 3), text.size());
    EXPECT_EQ(byte_offset_of(text, 99), text.size());
}

TEST(TextStatsTest, TextContentCarriesCounts) {
    const auto content = make_text_content("caf\xC3\xA9 au lait");
    EXPECT_EQ(content.word_count, 3u);
    EXPECT_EQ(content.char_count, 12u);
    EXPECT_EQ(content.content, "caf\xC3\xA9 au lait");
}

TEST(TextStatsTest, StatisticsCoverLinesParagraphsAndSentences) {
    const auto stats = compute_statistics("One two. Three four five!\n\nSix?");
    EXPECT_EQ(stats.word_count, 6u);
    EXPECT_EQ(stats.line_count, 3u);
    EXPECT_EQ(stats.paragraph_count, 2u);
    EXPECT_EQ(stats.sentence_count, 3u);
    EXPECT_DOUBLE_EQ(stats.average_words_per_sentence, 2.0);
    EXPECT_DOUBLE_EQ(stats.average_chars_per_word,
                     static_cast<double>(stats.char_count) / 6.0);
}

TEST(TextStatsTest, EmptyTextHasNoDivisionByZero) {
    const auto stats = compute_statistics("");
    EXPECT_EQ(stats.word_count, 0u);
    EXPECT_EQ(stats.sentence_count, 0u);
    EXPECT_EQ(stats.paragraph_count, 0u);
    EXPECT_EQ(stats.line_count, 1u);
    EXPECT_DOUBLE_EQ(stats.average_words_per_sentence, 0.0);
    EXPECT_DOUBLE_EQ(stats.average_chars_per_word, 0.0);
}

TEST(TextStatsTest, MatchContextIsCaseInsensitiveAndMarksCuts) {
    const std::string content = std::string(300, 'x') + " Quarterly Report " + std::string(300, 'y');

    const auto context = match_context(content, "quarterly report", 40);
    EXPECT_EQ(context.rfind("...", 0), 0u);
    EXPECT_EQ(context.substr(context.size() - 3), "...");
    EXPECT_NE(context.find("Quarterly Report"), std::string::npos);

    EXPECT_EQ(match_context("short text", "absent"), "");
    EXPECT_EQ(match_context("short text", "TEXT"), "short text");
}

TEST(TextStatsTest, ContainsIgnoreCase) {
    EXPECT_TRUE(contains_ignore_case("Invoice Total", "invoice"));
    EXPECT_FALSE(contains_ignore_case("Invoice Total", "receipt"));
}

}  // namespace
