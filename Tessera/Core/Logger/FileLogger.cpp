//------------------------------------------------------------------------------
// FileLogger.cpp
//
// File output implementation
//------------------------------------------------------------------------------

#include "Tessera/Core/Logger/FileLogger.hpp"
#include <stdexcept>

namespace Tessera
{
	FileLogger::FileLogger(const std::string& filename)
		: m_Path(filename)
	{
		m_File.open(filename, std::ios::app);
		if (!m_File.is_open())
		{
			throw std::runtime_error("Failed to open log file: " + filename);
		}
	}

	FileLogger::~FileLogger()
	{
		if (m_File.is_open())
		{
			m_File.close();
		}
	}

	void FileLogger::Write(LogLevel level, const std::string& message)
	{
		std::lock_guard<std::mutex> lock(m_FileMutex);

		if (!m_File.is_open())
			return;

		m_File << message << '\n';

		// Errors are flushed right away so they survive a crash
		if (level >= LogLevel::Warn)
			m_File.flush();
	}
}
