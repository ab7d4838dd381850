#include "core/TransformEngine.hpp"
#include "cipher/Vigenere/DoubleVigenere.hpp"

std::vector<uint8_t> TransformEngine::encode(const std::vector<uint8_t>& data, const Key& key1,
    const Key& key2) const
{
    DoubleVigenere cipher(key1, key2);
    return shuffleMode.encrypt(data, cipher);
}

std::vector<uint8_t> TransformEngine::decode(const std::vector<uint8_t>& data, const Key& key1,
    const Key& key2) const
{
    DoubleVigenere cipher(key1, key2);
    return shuffleMode.decrypt(data, cipher);
}

std::string TransformEngine::encode(const std::string& text, const std::string& key1,
    const std::string& key2) const
{
    auto out = encode(std::vector<uint8_t>(text.begin(), text.end()), Key(key1), Key(key2));
    return std::string(out.begin(), out.end());
}

std::string TransformEngine::decode(const std::string& text, const std::string& key1,
    const std::string& key2) const
{
    auto out = decode(std::vector<uint8_t>(text.begin(), text.end()), Key(key1), Key(key2));
    return std::string(out.begin(), out.end());
}

std::size_t TransformEngine::encodeStream(std::istream& reader, std::ostream& writer, const Key& key1,
    const Key& key2) const
{
    DoubleVigenere cipher(key1, key2);
    return streamMode.encryptStream(reader, writer, cipher);
}

std::size_t TransformEngine::decodeStream(std::istream& reader, std::ostream& writer, const Key& key1,
    const Key& key2) const
{
    DoubleVigenere cipher(key1, key2);
    return streamMode.decryptStream(reader, writer, cipher);
}
