#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include <core/Key.hpp>
#include <mode/ShuffleMode.hpp>
#include <mode/StreamMode.hpp>

// Entry point of the library.
//
// encode = shuffle(substitute(data)), decode = unsubstitute(unshuffle(data)).
// Key streams restart at index 0 on every call and nothing is kept between
// calls, so one engine can serve several threads at once.
//
// Errors: InvalidKeyError (from Key), OutOfRangeCharacterError for codes
// >= 128, StreamIOError from the stream variants.
class TransformEngine {
public:
    std::vector<uint8_t> encode(const std::vector<uint8_t>& data, const Key& key1,
        const Key& key2 = Key::defaultSecond()) const;

    std::vector<uint8_t> decode(const std::vector<uint8_t>& data, const Key& key1,
        const Key& key2 = Key::defaultSecond()) const;

    std::string encode(const std::string& text, const std::string& key1,
        const std::string& key2 = Key::kDefaultSecond) const;

    std::string decode(const std::string& text, const std::string& key1,
        const std::string& key2 = Key::kDefaultSecond) const;

    // Per-character substitution without the interleave. Returns the
    // number of characters written.
    std::size_t encodeStream(std::istream& reader, std::ostream& writer, const Key& key1,
        const Key& key2 = Key::defaultSecond()) const;

    std::size_t decodeStream(std::istream& reader, std::ostream& writer, const Key& key1,
        const Key& key2 = Key::defaultSecond()) const;

private:
    ShuffleMode shuffleMode;
    StreamMode streamMode;
};
