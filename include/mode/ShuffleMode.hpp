#pragma once
#include <mode/mode.hpp>

// Whole-buffer mode: substitute, then interleave the result.
class ShuffleMode : public Mode {
public:
    std::vector<uint8_t> encrypt(const std::vector<uint8_t>& data, const Cipher& cipher) const override;
    std::vector<uint8_t> decrypt(const std::vector<uint8_t>& data, const Cipher& cipher) const override;
};
