#include "Tessera/Core/FileUtils.hpp"

#include <cstring>
#include <fstream>
#include <stdexcept>

namespace Tessera
{
	namespace
	{
		constexpr uint32_t SPIRV_MAGIC = 0x07230203;
	}

	std::vector<char> FileUtils::ReadFileAsChars(const std::string& filePath)
	{
		std::ifstream file(filePath, std::ios::ate | std::ios::binary);

		if (!file.is_open())
		{
			throw std::runtime_error("Failed to open file: " + filePath);
		}

		size_t fileSize = static_cast<size_t>(file.tellg());
		std::vector<char> buffer(fileSize);
		file.seekg(0);
		file.read(buffer.data(), static_cast<std::streamsize>(fileSize));

		if (!file)
		{
			throw std::runtime_error("Failed to read file: " + filePath);
		}

		return buffer;
	}

	std::vector<uint32_t> FileUtils::ReadSpirV(const std::string& filePath)
	{
		std::vector<char> bytes = ReadFileAsChars(filePath);

		if (bytes.empty() || bytes.size() % sizeof(uint32_t) != 0)
		{
			throw std::runtime_error("Invalid SPIR-V size (" + std::to_string(bytes.size()) + " bytes): " + filePath);
		}

		std::vector<uint32_t> words(bytes.size() / sizeof(uint32_t));
		std::memcpy(words.data(), bytes.data(), bytes.size());

		if (words[0] != SPIRV_MAGIC)
		{
			throw std::runtime_error("Not a SPIR-V binary: " + filePath);
		}

		return words;
	}

	std::string FileUtils::JoinPath(const std::string& directory, const std::string& fileName)
	{
		if (directory.empty())
			return fileName;

		char last = directory.back();
		if (last == '/' || last == '\\')
			return directory + fileName;

		return directory + "/" + fileName;
	}
}
