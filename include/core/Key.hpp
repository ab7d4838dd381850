#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Key material for one of the two substitution stages.
// Always non-empty and 7-bit; the buffer is wiped when the key goes away.
class Key {
public:
    // Public fallback for the second stage. Not a secret.
    static constexpr const char* kDefaultSecond = "]09agvn cv8eA ino;av 478uyTR`~=( ADJ OD *^t";

    explicit Key(const std::string& text);
    explicit Key(std::vector<uint8_t> data);

    Key(const Key& other) = default;
    Key& operator=(const Key& other) = default;

    ~Key();

    static const Key& defaultSecond();

    std::size_t size() const noexcept { return data.size(); }
    uint8_t operator[](std::size_t i) const noexcept { return data[i]; }
    const std::vector<uint8_t>& bytes() const noexcept { return data; }

private:
    void validate() const;
    void secure_zero() noexcept;

    std::vector<uint8_t> data;
};
