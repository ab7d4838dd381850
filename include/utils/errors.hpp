#pragma once
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

// Base for every failure reported by the transform.
class CipherError : public std::runtime_error {
public:
    explicit CipherError(const std::string& what) : std::runtime_error(what) {}
};

// Empty key, or a key holding a code outside the 7-bit alphabet.
class InvalidKeyError : public CipherError {
public:
    explicit InvalidKeyError(const std::string& what) : CipherError(what) {}
};

class OutOfRangeCharacterError : public CipherError {
public:
    OutOfRangeCharacterError(std::size_t offset, unsigned value)
        : CipherError("Character 0x" + toHex(value) + " at offset " + std::to_string(offset)
              + " is outside the 7-bit range"),
          offset_(offset), value_(value) {
    }

    std::size_t offset() const noexcept { return offset_; }
    unsigned value() const noexcept { return value_; }

private:
    static std::string toHex(unsigned v) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << v;
        return oss.str();
    }

    std::size_t offset_;
    unsigned value_;
};

// Read or write failure while streaming; output already written is left as is.
class StreamIOError : public CipherError {
public:
    explicit StreamIOError(const std::string& what) : CipherError(what) {}
};
