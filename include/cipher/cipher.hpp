#pragma once
#include <cstddef>
#include <cstdint>

#include "cipher/KeySchedule.hpp"

class Cipher {
public:
	virtual ~Cipher() = default;

	// Size of the character alphabet
	virtual std::size_t modulus() const = 0;

	// Substitute `count` codes from `in` into `out`, continuing the key streams at `ks`.
	// `in` and `out` may alias.
	virtual void encryptChars(const uint8_t* in, uint8_t* out, std::size_t count, KeySchedule& ks) const = 0;

	// Inverse of encryptChars for the same starting schedule
	virtual void decryptChars(const uint8_t* in, uint8_t* out, std::size_t count, KeySchedule& ks) const = 0;
};
