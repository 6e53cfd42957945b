//------------------------------------------------------------------------------
// ConsoleLogger.hpp
//
// Console output sink for logging system
//------------------------------------------------------------------------------

#pragma once

#include "Tessera/Core/Logger/Logger.hpp"

namespace Tessera
{
	class ConsoleLogger : public ILogSink
	{
	public:
		explicit ConsoleLogger(bool useColors = true);
		~ConsoleLogger() override = default;

		// Warn and Error go to stderr, everything else to stdout
		void Write(LogLevel level, const std::string& message) override;

	private:
		bool m_UseColors;

		//Platform-specific color handling
		void SetConsoleColor(LogLevel level);
		void ResetConsoleColor(LogLevel level);
	};
}
