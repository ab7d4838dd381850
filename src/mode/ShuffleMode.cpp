#include "mode/ShuffleMode.hpp"
#include "utils/Interleave.hpp"
#include "utils/errors.hpp"

std::vector<uint8_t> ShuffleMode::encrypt(const std::vector<uint8_t>& data, const Cipher& cipher) const
{
    std::vector<uint8_t> out(data.size());
    KeySchedule ks;

    cipher.encryptChars(data.data(), out.data(), out.size(), ks);

    return utils::shuffle(out);
}

std::vector<uint8_t> ShuffleMode::decrypt(const std::vector<uint8_t>& data, const Cipher& cipher) const
{
    // check before unshuffling so the offset points into the ciphertext
    for (std::size_t i = 0; i < data.size(); ++i) {
        if (static_cast<std::size_t>(data[i]) >= cipher.modulus())
            throw OutOfRangeCharacterError(i, data[i]);
    }

    std::vector<uint8_t> out = utils::unshuffle(data);
    KeySchedule ks;

    cipher.decryptChars(out.data(), out.data(), out.size(), ks);
    return out;
}
