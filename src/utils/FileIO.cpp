#include "utils/FileIO.hpp"
#include "utils/errors.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace utils {

	std::vector<uint8_t> readFile(const std::filesystem::path& path) {
		std::ifstream in(path, std::ios::binary);
		if (!in.is_open())
			throw StreamIOError("Could not open file: " + path.string());

		std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
		if (in.bad())
			throw StreamIOError("Could not read file: " + path.string());
		return data;
	}

	void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
		std::ofstream out(path, std::ios::binary | std::ios::trunc);
		if (!out.is_open())
			throw StreamIOError("Could not create file: " + path.string());

		out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
		out.flush();
		if (!out)
			throw StreamIOError("Could not write file: " + path.string());
	}

	void requireDistinctPaths(const std::filesystem::path& input, const std::filesystem::path& output) {
		std::error_code ec;
		if (!std::filesystem::exists(output, ec))
			return;

		bool same = std::filesystem::equivalent(input, output, ec);
		if (ec)
			throw StreamIOError("Could not compare " + input.string() + " and " + output.string() + ": " + ec.message());
		if (same)
			throw StreamIOError("Output file is the input file: " + output.string());
	}

	std::filesystem::path defaultOutputPath(const std::filesystem::path& input, bool encrypting) {
		std::filesystem::path out = input;
		out += encrypting ? ".enc" : ".dec";
		return out;
	}

} // namespace utils
