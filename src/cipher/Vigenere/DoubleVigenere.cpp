#include "cipher/Vigenere/DoubleVigenere.hpp"
#include "utils/errors.hpp"

DoubleVigenere::DoubleVigenere(const Key& first, const Key& second)
    : key1(first), key2(second)
{
}

uint8_t DoubleVigenere::encryptChar(uint8_t c, uint8_t k1, uint8_t k2)
{
    int x = (c + k1) % kModulus;
    int y = (x + k2) % kModulus;
    return static_cast<uint8_t>(y);
}

uint8_t DoubleVigenere::decryptChar(uint8_t c, uint8_t k1, uint8_t k2)
{
    // undo key2 first, then key1
    int x = c - k2;
    if (x < 0) x += kModulus;
    int y = x - k1;
    if (y < 0) y += kModulus;
    return static_cast<uint8_t>(y);
}

void DoubleVigenere::encryptChars(const uint8_t* in, uint8_t* out, std::size_t count, KeySchedule& ks) const
{
    for (std::size_t n = 0; n < count; ++n) {
        if (in[n] >= kModulus)
            throw OutOfRangeCharacterError(ks.position, in[n]);

        out[n] = encryptChar(in[n], key1[ks.first], key2[ks.second]);
        ks.advance(key1.size(), key2.size());
    }
}

void DoubleVigenere::decryptChars(const uint8_t* in, uint8_t* out, std::size_t count, KeySchedule& ks) const
{
    for (std::size_t n = 0; n < count; ++n) {
        if (in[n] >= kModulus)
            throw OutOfRangeCharacterError(ks.position, in[n]);

        out[n] = decryptChar(in[n], key1[ks.first], key2[ks.second]);
        ks.advance(key1.size(), key2.size());
    }
}
