#include "core/Key.hpp"
#include "cipher/Vigenere/DoubleVigenere.hpp"
#include "utils/errors.hpp"

#include <utility>

Key::Key(const std::string& text)
    : data(text.begin(), text.end())
{
    validate();
}

Key::Key(std::vector<uint8_t> bytes)
    : data(std::move(bytes))
{
    validate();
}

Key::~Key()
{
    secure_zero();
}

const Key& Key::defaultSecond()
{
    static const Key key(kDefaultSecond);
    return key;
}

void Key::validate() const
{
    if (data.empty())
        throw InvalidKeyError("Key must not be empty");

    for (std::size_t i = 0; i < data.size(); ++i) {
        if (data[i] >= DoubleVigenere::kModulus)
            throw InvalidKeyError("Key byte " + std::to_string(i) + " is outside the 7-bit range");
    }
}

void Key::secure_zero() noexcept
{
    volatile uint8_t* p = data.data();
    for (std::size_t i = 0; i < data.size(); ++i)
        p[i] = 0;
}
