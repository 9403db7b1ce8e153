#include "wake_word.hpp"

#include <gtest/gtest.h>

TEST(WakeWord, FindsFirstListedWordCaseInsensitively) {
    auto d = detect_wake_word("hello wake word test", {"Wake", "Test"});
    EXPECT_TRUE(d.detected);
    EXPECT_EQ(d.start_idx, 6u);
    EXPECT_EQ(d.end_idx, 10u);
}

TEST(WakeWord, ListOrderBeatsTextPosition) {
    auto d = detect_wake_word("hello wake word test", {"test", "wake"});
    EXPECT_TRUE(d.detected);
    EXPECT_EQ(d.start_idx, 16u);
    EXPECT_EQ(d.end_idx, 20u);
}

TEST(WakeWord, UppercaseTranscript) {
    auto d = detect_wake_word("HEY COMPUTER", {"computer"});
    EXPECT_TRUE(d.detected);
    EXPECT_EQ(d.start_idx, 4u);
    EXPECT_EQ(d.end_idx, 12u);
}

TEST(WakeWord, NoMatch) {
    auto d = detect_wake_word("nothing here", {"jarvis"});
    EXPECT_FALSE(d.detected);
    EXPECT_FALSE(d.start_idx.has_value());
    EXPECT_FALSE(d.end_idx.has_value());
}

TEST(WakeWord, EmptyInputs) {
    EXPECT_FALSE(detect_wake_word("", {"hey"}).detected);
    EXPECT_FALSE(detect_wake_word("hey", {}).detected);
    EXPECT_FALSE(detect_wake_word("hey", {""}).detected);

    auto d = detect_wake_word("hey", {"", "hey"});
    EXPECT_TRUE(d.detected);
    EXPECT_EQ(d.start_idx, 0u);
}

TEST(WakeWord, SubstringMatch) {
    auto d = detect_wake_word("heyday", {"hey"});
    EXPECT_TRUE(d.detected);
    EXPECT_EQ(d.end_idx, 3u);
}

TEST(JoinSegments, Concatenates) {
    EXPECT_EQ(join_segments({"hey ", "there"}), "hey there");
    EXPECT_EQ(join_segments({}), "");
}
