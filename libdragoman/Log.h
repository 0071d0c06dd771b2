/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef LOG_H__
#define LOG_H__

#include <ctime>
#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <memory>
#include <mutex>
#include "Queue.h"

#ifndef _WIN32
#include <syslog.h>
#endif

enum LogLevel
{
	eLogNone = 0,
	eLogError,
	eLogWarning,
	eLogInfo,
	eLogDebug,
	eNumLogLevels
};

enum LogType {
	eLogStdout = 0,
	eLogStream,
	eLogFile,
#ifndef _WIN32
	eLogSyslog,
#endif
};

namespace dragoman {
namespace log {

	struct LogMsg
	{
		std::time_t timestamp;
		LogLevel level;
		std::string text;

		LogMsg (LogLevel lvl, std::string&& txt): timestamp (std::time (nullptr)), level (lvl), text (std::move (txt)) {};
	};

	/**
	 * @brief Process wide log sink
	 *
	 * Messages are written as they come. An application that configures
	 * the destination late may Hold () the output and release it with
	 * Ready (), messages in between are kept in order.
	 */
	class Log
	{
		public:

			Log ();
			~Log ();
			Log (const Log&) = delete;
			Log& operator= (const Log&) = delete;

			LogType  GetLogType  () const { return m_Destination; };
			LogLevel GetLogLevel () const { return m_MinLevel; };
			bool HasColors () const { return m_HasColors; };

			/**
			 * @brief Set minimal level of written messages
			 * @param level  "none", "error", "warn", "info" or "debug"
			 * @return false for unknown level, the current one is kept
			 */
			bool SetLogLevel (const std::string& level);

			/** @brief Append to file, stays on previous destination if it can't be opened */
			void SendTo (const std::string& path);
			void SendTo (std::shared_ptr<std::ostream> os);
#ifndef _WIN32
			void SendTo (const char * name, int facility);
#endif

			void Append (std::shared_ptr<LogMsg> msg);

			/** @brief Keep messages until Ready () */
			void Hold ();
			/** @brief Write held messages and write directly from now on */
			void Ready ();
			void Flush ();

			size_t GetNumHeldMessages () const { return m_Held.GetSize (); };

		private:

			void Write (const LogMsg& msg);
			const char * TimeAsString (std::time_t t);

		private:

			LogType m_Destination;
			LogLevel m_MinLevel;
			std::shared_ptr<std::ostream> m_LogStream;
			bool m_HasColors;
			bool m_IsHeld;
			dragoman::util::Queue<std::shared_ptr<LogMsg> > m_Held;
			std::time_t m_LastTimestamp;
			char m_LastTime[16];
			std::mutex m_OutputMutex;
	};

	Log & Logger ();

	const char * GetLevelColor (LogLevel level);
	const char * GetColorReset ();
} // log
} // dragoman

/** internal usage only -- folding args array to single string */
template<typename TValue>
void LogPrint (std::stringstream& s, TValue&& arg) noexcept
{
	s << std::forward<TValue>(arg);
}

/**
 * @brief Create log message and pass it to the logger
 * @param level Message level (eLogError, eLogInfo, ...)
 * @param args Array of message parts
 */
template<typename... TArgs>
void LogPrint (LogLevel level, TArgs&&... args) noexcept
{
	auto& log = dragoman::log::Logger ();
	if (level > log.GetLogLevel ())
		return;

	std::stringstream ss;
	if (log.HasColors ())
		ss << dragoman::log::GetLevelColor (level);
	(LogPrint (ss, std::forward<TArgs>(args)), ...);
	if (log.HasColors ())
		ss << dragoman::log::GetColorReset ();

	log.Append (std::make_shared<dragoman::log::LogMsg>(level, ss.str ()));
}

#endif // LOG_H__
