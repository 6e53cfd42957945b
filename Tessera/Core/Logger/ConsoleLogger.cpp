//------------------------------------------------------------------------------
// ConsoleLogger.cpp
//
// Console output implementation with color support
//------------------------------------------------------------------------------

#include "Tessera/Core/Logger/ConsoleLogger.hpp"
#include "Tessera/Core/Platform.hpp"
#include <iostream>

namespace Tessera
{
	namespace
	{
		std::ostream& StreamFor(LogLevel level)
		{
			return (level >= LogLevel::Warn) ? std::cerr : std::cout;
		}
	}

	ConsoleLogger::ConsoleLogger(bool useColors)
		: m_UseColors(useColors)
	{
	}

	void ConsoleLogger::Write(LogLevel level, const std::string& message)
	{
		if (m_UseColors)
			SetConsoleColor(level);

		StreamFor(level) << message;

		if (m_UseColors)
			ResetConsoleColor(level);

		StreamFor(level) << std::endl;
	}

	void ConsoleLogger::SetConsoleColor(LogLevel level)
	{
#ifdef TESSERA_PLATFORM_WINDOWS
		HANDLE hConsole = GetStdHandle(level >= LogLevel::Warn ? STD_ERROR_HANDLE : STD_OUTPUT_HANDLE);
		WORD color;

		switch (level)
		{
		case LogLevel::Trace:
			color = FOREGROUND_INTENSITY; //Gray
			break;
		case LogLevel::Debug:
			color = FOREGROUND_GREEN | FOREGROUND_BLUE; // Cyan
			break;
		case LogLevel::Warn:
			color = FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_INTENSITY; // Yellow
			break;
		case LogLevel::Error:
			color = FOREGROUND_RED | FOREGROUND_INTENSITY; // Red
			break;
		default:
			color = FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE;
			break;
		}

		SetConsoleTextAttribute(hConsole, color);
#else
		std::ostream& out = StreamFor(level);
		switch (level)
		{
		case LogLevel::Trace:
			out << "\033[90m"; // Gray
			break;
		case LogLevel::Debug:
			out << "\033[36m"; // Cyan
			break;
		case LogLevel::Warn:
			out << "\033[33m"; // Yellow
			break;
		case LogLevel::Error:
			out << "\033[91m"; // Red
			break;
		default:
			break;
		}
#endif
	}

	void ConsoleLogger::ResetConsoleColor(LogLevel level)
	{
#ifdef TESSERA_PLATFORM_WINDOWS
		HANDLE hConsole = GetStdHandle(level >= LogLevel::Warn ? STD_ERROR_HANDLE : STD_OUTPUT_HANDLE);
		SetConsoleTextAttribute(hConsole, FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE);
#else
		StreamFor(level) << "\033[0m";
#endif
	}
}
