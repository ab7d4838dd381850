#include "utils/Interleave.hpp"

namespace utils {

	std::vector<uint8_t> shuffle(const std::vector<uint8_t>& s) {
		const std::size_t n = s.size();
		const std::size_t m = evenCount(n);
		std::vector<uint8_t> out(n);

		// evens land reversed in [0, m), odds reversed in [m, n)
		for (std::size_t k = 0; k < m; k++)
			out[m - 1 - k] = s[2 * k];
		for (std::size_t k = 0; k < n - m; k++)
			out[n - 1 - k] = s[2 * k + 1];

		return out;
	}

	std::vector<uint8_t> unshuffle(const std::vector<uint8_t>& c) {
		const std::size_t n = c.size();
		const std::size_t m = evenCount(n);
		std::vector<uint8_t> out(n);

		for (std::size_t k = 0; k < m; k++)
			out[2 * k] = c[m - 1 - k];
		for (std::size_t k = 0; k < n - m; k++)
			out[2 * k + 1] = c[n - 1 - k];

		return out;
	}

} // namespace utils
