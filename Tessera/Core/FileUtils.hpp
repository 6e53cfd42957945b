// FileUtils.hpp
//
// Whole-file reads. All functions throw std::runtime_error on failure.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Tessera
{
	class FileUtils
	{
	public:
		// Reads the entire file into a vector of chars
		static std::vector<char> ReadFileAsChars(const std::string& filePath);

		// Reads a SPIR-V binary. The size must be a non-zero multiple of 4
		// and the first word must be the SPIR-V magic number.
		static std::vector<uint32_t> ReadSpirV(const std::string& filePath);

		// Joins a directory and a file name with a single separator
		static std::string JoinPath(const std::string& directory, const std::string& fileName);
	};
}
