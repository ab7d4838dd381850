#include <gtest/gtest.h>
#include "core/Key.hpp"
#include "utils/errors.hpp"
#include <string>
#include <vector>

TEST(Key, HoldsBytes)
{
    Key key("sayaka");
    ASSERT_EQ(key.size(), 6u);
    EXPECT_EQ(key[0], 's');
    EXPECT_EQ(key[5], 'a');
}

TEST(Key, EmptyIsRejected)
{
    EXPECT_THROW(Key{ std::string() }, InvalidKeyError);
    EXPECT_THROW(Key(std::vector<uint8_t>{}), InvalidKeyError);
}

TEST(Key, HighByteIsRejected)
{
    EXPECT_THROW(Key(std::vector<uint8_t>{ 'a', 0x80 }), InvalidKeyError);
    EXPECT_THROW(Key(std::string("caf\xC3\xA9")), InvalidKeyError);
}

TEST(Key, InvalidKeyIsACipherError)
{
    try {
        Key k{ std::string() };
        FAIL() << "expected InvalidKeyError";
    }
    catch (const CipherError& e) {
        EXPECT_NE(std::string(e.what()).find("empty"), std::string::npos);
    }
}

TEST(Key, FullSevenBitRangeAccepted)
{
    std::vector<uint8_t> all(128);
    for (size_t i = 0; i < all.size(); ++i)
        all[i] = static_cast<uint8_t>(i);

    Key key(all);
    EXPECT_EQ(key.size(), 128u);
    EXPECT_EQ(key[127], 127);
}

TEST(Key, DefaultSecondMatchesConstant)
{
    const Key& d = Key::defaultSecond();
    EXPECT_EQ(std::string(d.bytes().begin(), d.bytes().end()), std::string(Key::kDefaultSecond));
    EXPECT_EQ(&d, &Key::defaultSecond());
}

TEST(Key, CopyIsIndependent)
{
    Key a("first");
    Key b = a;
    a = Key("other");

    EXPECT_EQ(std::string(b.bytes().begin(), b.bytes().end()), "first");
    EXPECT_EQ(std::string(a.bytes().begin(), a.bytes().end()), "other");
}
