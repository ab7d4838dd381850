#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace utils {

	// Length of the leading (even-index) half for a sequence of n elements
	inline std::size_t evenCount(std::size_t n) { return (n + 1) / 2; }

	// reverse(s[0], s[2], ...) ++ reverse(s[1], s[3], ...)
	std::vector<uint8_t> shuffle(const std::vector<uint8_t>& s);

	// Inverse of shuffle; the split point follows from the length alone.
	std::vector<uint8_t> unshuffle(const std::vector<uint8_t>& c);

} // namespace utils
