//------------------------------------------------------------------------------
// FileLogger.hpp
//
// File output sink for logging system
//------------------------------------------------------------------------------

#pragma once

#include "Tessera/Core/Logger/Logger.hpp"
#include <fstream>

namespace Tessera
{
	class FileLogger : public ILogSink
	{
	public:
		// Appends to the file; throws std::runtime_error if it cannot be opened
		explicit FileLogger(const std::string& filename);
		~FileLogger() override;

		void Write(LogLevel level, const std::string& message) override;

		bool IsOpen() const { return m_File.is_open(); }
		const std::string& GetPath() const { return m_Path; }

	private:
		std::string m_Path;
		std::ofstream m_File;
		std::mutex m_FileMutex;
	};
}
