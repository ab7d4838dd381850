#pragma once
#include <cstddef>
#include <istream>
#include <ostream>
#include <mode/mode.hpp>

// Per-character mode. Each code is substituted and written as soon as it is
// read, so the interleave step is never applied. Buffer the input and use
// ShuffleMode to get the interleaved form.
class StreamMode : public Mode {
public:
    std::vector<uint8_t> encrypt(const std::vector<uint8_t>& data, const Cipher& cipher) const override;
    std::vector<uint8_t> decrypt(const std::vector<uint8_t>& data, const Cipher& cipher) const override;

    // Both return the number of characters written. Throw StreamIOError when
    // the reader or writer fails; output written before the failure stays.
    std::size_t encryptStream(std::istream& reader, std::ostream& writer, const Cipher& cipher) const;
    std::size_t decryptStream(std::istream& reader, std::ostream& writer, const Cipher& cipher) const;

private:
    enum class Direction { Encrypt, Decrypt };

    std::size_t run(std::istream& reader, std::ostream& writer, const Cipher& cipher, Direction dir) const;

    // Next code, or eof() at the end of input. Read errors become StreamIOError.
    static std::istream::int_type readChar(std::istream& reader, std::size_t position);
};
