#include <gtest/gtest.h>
#include "utils/Interleave.hpp"
#include <numeric>
#include <vector>

static std::vector<uint8_t> iota(size_t n)
{
    std::vector<uint8_t> v(n);
    std::iota(v.begin(), v.end(), static_cast<uint8_t>(1));
    return v;
}

TEST(Interleave, OddLengthShuffle)
{
    std::vector<uint8_t> s = { 10, 20, 30, 40, 50 };
    std::vector<uint8_t> expected = { 50, 30, 10, 40, 20 };

    EXPECT_EQ(utils::shuffle(s), expected);
}

TEST(Interleave, OddLengthUnshuffle)
{
    std::vector<uint8_t> c = { 50, 30, 10, 40, 20 };
    std::vector<uint8_t> expected = { 10, 20, 30, 40, 50 };

    EXPECT_EQ(utils::unshuffle(c), expected);
}

TEST(Interleave, EvenLengthShuffle)
{
    std::vector<uint8_t> s = { 1, 2, 3, 4, 5, 6 };
    std::vector<uint8_t> expected = { 5, 3, 1, 6, 4, 2 };

    EXPECT_EQ(utils::shuffle(s), expected);
    EXPECT_EQ(utils::unshuffle(expected), s);
}

TEST(Interleave, EmptyAndSingle)
{
    std::vector<uint8_t> empty;
    EXPECT_TRUE(utils::shuffle(empty).empty());
    EXPECT_TRUE(utils::unshuffle(empty).empty());

    std::vector<uint8_t> one = { 42 };
    EXPECT_EQ(utils::shuffle(one), one);
    EXPECT_EQ(utils::unshuffle(one), one);
}

TEST(Interleave, TwoElementsSwapNothing)
{
    // evens = [a], odds = [b]; each half reversed is itself
    std::vector<uint8_t> two = { 7, 9 };
    EXPECT_EQ(utils::shuffle(two), two);
}

TEST(Interleave, InverseForEveryLengthUpTo64)
{
    for (size_t n = 0; n <= 64; ++n) {
        auto s = iota(n);
        auto c = utils::shuffle(s);
        EXPECT_EQ(c.size(), n);
        EXPECT_EQ(utils::unshuffle(c), s) << "length " << n;
    }
}

TEST(Interleave, SplitPointIsCeilHalf)
{
    EXPECT_EQ(utils::evenCount(0), 0u);
    EXPECT_EQ(utils::evenCount(1), 1u);
    EXPECT_EQ(utils::evenCount(4), 2u);
    EXPECT_EQ(utils::evenCount(5), 3u);
}
