#pragma once
#include <cstddef>
#include <cstdint>

#include <cipher/cipher.hpp>
#include <core/Key.hpp>

// Vigenère applied twice: first with key1, then with key2, over the 7-bit alphabet.
// Both keys rotate independently, one step per character.
class DoubleVigenere : public Cipher
{
public:
    static constexpr int kModulus = 128;

    explicit DoubleVigenere(const Key& key1, const Key& key2 = Key::defaultSecond());

    std::size_t modulus() const override { return kModulus; }

    void encryptChars(const uint8_t* in, uint8_t* out, std::size_t count, KeySchedule& ks) const override;

    void decryptChars(const uint8_t* in, uint8_t* out, std::size_t count, KeySchedule& ks) const override;

    // --- single character stages ---
    static uint8_t encryptChar(uint8_t c, uint8_t k1, uint8_t k2);

    static uint8_t decryptChar(uint8_t c, uint8_t k1, uint8_t k2);

    const Key& firstKey() const noexcept { return key1; }
    const Key& secondKey() const noexcept { return key2; }

private:
    Key key1;
    Key key2;
};
