#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace utils {

	// Whole-file helpers for the command line. Failures throw StreamIOError.
	std::vector<uint8_t> readFile(const std::filesystem::path& path);

	void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data);

	// Throws StreamIOError when output names the same file as input. Streaming
	// truncates the output before the input has been read.
	void requireDistinctPaths(const std::filesystem::path& input, const std::filesystem::path& output);

	// "<input>.enc" when encrypting, "<input>.dec" when decrypting
	std::filesystem::path defaultOutputPath(const std::filesystem::path& input, bool encrypting);

} // namespace utils
