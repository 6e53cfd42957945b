//------------------------------------------------------------------------------
// Logger.hpp
//
// Core logging system for Tessera
//------------------------------------------------------------------------------

#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <vector>
#include <mutex>
#include <atomic>
#include <format>
#include <optional>

namespace Tessera
{
	enum class LogLevel
	{
		Trace,
		Debug,
		Info,
		Warn,
		Error,
		None
	};

	const char* LogLevelToString(LogLevel level);

	// Case-insensitive; accepts "trace", "debug", "info", "warn"/"warning", "error", "none"
	std::optional<LogLevel> ParseLogLevel(std::string_view text);

	class ILogSink;

	// Sink setup in one call; what a host normally does at startup
	struct LoggerConfig
	{
		LogLevel minLevel = LogLevel::Info;
		bool console = true;
		bool consoleColors = true;
		std::string filePath;  // Empty = no file sink
	};

	// a singleton logger class that will handle logging messages
	class Logger
	{
	public:

		// singleton instance access
		static Logger& Get();

		// config
		void SetLogLevel(LogLevel level);
		LogLevel GetLogLevel() const { return m_MinLogLevel.load(); }
		void AddSink(std::shared_ptr<ILogSink> sink);
		void ClearSinks();

		// Replaces all sinks. Throws if the file sink cannot be opened.
		void Configure(const LoggerConfig& config);

		// Core Logging Function
		void Log(LogLevel level, const std::string& message);

		//Formatted logging
		template<typename... Args>
		void LogFormatted(LogLevel level, std::format_string<Args...> format, Args&&... args)
		{
			if (level < m_MinLogLevel.load())
				return;

			Log(level, std::format(format, std::forward<Args>(args)...));
		}

	private:
		Logger() = default;
		~Logger() = default;
		Logger(const Logger&) = delete;
		Logger& operator=(const Logger&) = delete;

		std::atomic<LogLevel> m_MinLogLevel = LogLevel::Trace;
		std::vector<std::shared_ptr<ILogSink>> m_Sinks;
		std::mutex m_Mutex;
	};

	// sink interface for logging
	class ILogSink
	{
	public:
		virtual ~ILogSink() = default;
		virtual void Write(LogLevel level, const std::string& message) = 0;
	};
}

// Convenience macros for logging
#define LOG_TRACE(...) ::Tessera::Logger::Get().LogFormatted(::Tessera::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ::Tessera::Logger::Get().LogFormatted(::Tessera::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)  ::Tessera::Logger::Get().LogFormatted(::Tessera::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)  ::Tessera::Logger::Get().LogFormatted(::Tessera::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ::Tessera::Logger::Get().LogFormatted(::Tessera::LogLevel::Error, __VA_ARGS__)
