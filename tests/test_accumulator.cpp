#include "accumulator.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <numeric>
#include <random>
#include <vector>

namespace {

std::vector<float> ramp(std::size_t start, std::size_t n) {
    std::vector<float> v(n);
    for (std::size_t i = 0; i < n; ++i) v[i] = static_cast<float>(start + i);
    return v;
}

} // namespace

TEST(WindowSamples, AddsGuardToWholeSeconds) {
    EXPECT_EQ(window_samples(1000), 16200u);
    EXPECT_EQ(window_samples(3000), 48200u);
    EXPECT_EQ(window_samples(1500, 0), 16000u);
    EXPECT_EQ(window_samples(500, 200), 200u);
}

TEST(WindowSamples, RejectsEmptyWindow) {
    EXPECT_THROW(window_samples(999, 0), ConfigError);
    EXPECT_THROW(window_samples(0, 0), ConfigError);
}

TEST(Accumulator, RejectsZeroWindow) {
    EXPECT_THROW({ Accumulator empty(0); }, ConfigError);
    Accumulator acc(4);
    EXPECT_THROW(acc.set_window_size(0), ConfigError);
}

TEST(Accumulator, EmitsExactWindowsInOrder) {
    Accumulator acc(5);
    EXPECT_TRUE(acc.push(ramp(0, 3)).empty());

    auto windows = acc.push(ramp(3, 9));
    ASSERT_EQ(windows.size(), 2u);
    EXPECT_EQ(windows[0], ramp(0, 5));
    EXPECT_EQ(windows[1], ramp(5, 5));
    EXPECT_EQ(acc.remainder(), ramp(10, 2));
}

TEST(Accumulator, RandomChunkingLosesNothing) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<std::size_t> chunk_len(0, 700);

    const std::size_t window = 257;
    Accumulator acc(window);
    std::vector<float> emitted;
    std::size_t pushed = 0;
    for (int i = 0; i < 200; ++i) {
        const std::size_t n = chunk_len(rng);
        for (auto& w : acc.push(ramp(pushed, n))) {
            ASSERT_EQ(w.size(), window);
            emitted.insert(emitted.end(), w.begin(), w.end());
        }
        pushed += n;
    }

    EXPECT_EQ(emitted.size() + acc.buffered(), pushed);
    EXPECT_LT(acc.buffered(), window);
    emitted.insert(emitted.end(), acc.remainder().begin(), acc.remainder().end());
    EXPECT_EQ(emitted, ramp(0, pushed));
}

TEST(Accumulator, WindowSizeChangeAppliesToNextSplit) {
    Accumulator acc(4);
    acc.append(ramp(0, 10));

    std::vector<float> window;
    ASSERT_TRUE(acc.next_window(window));
    EXPECT_EQ(window, ramp(0, 4));

    acc.set_window_size(6);
    ASSERT_TRUE(acc.next_window(window));
    EXPECT_EQ(window, ramp(4, 6));
    EXPECT_FALSE(acc.next_window(window));
    EXPECT_EQ(acc.buffered(), 0u);
}

TEST(Accumulator, DrainAndReset) {
    Accumulator acc(8);
    acc.append(ramp(0, 3));
    EXPECT_EQ(acc.drain(), ramp(0, 3));
    EXPECT_EQ(acc.buffered(), 0u);

    acc.append(ramp(0, 5));
    acc.reset();
    EXPECT_EQ(acc.buffered(), 0u);
    EXPECT_EQ(acc.window_size(), 8u);
}
