/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include <unistd.h>
#include "Log.h"

namespace dragoman {
namespace log {
	static Log logger;

	static const char * levelNames[eNumLogLevels] =
	{
		"none", "error", "warn", "info", "debug"
	};

	// ISO 6429 sequences, reset last
	static const char * levelColors[eNumLogLevels + 1] =
	{
		"\033[1;32m", // none, green
		"\033[1;31m", // error, red
		"\033[1;33m", // warning, yellow
		"\033[1;36m", // info, cyan
		"\033[1;34m", // debug, blue
		"\033[0m"
	};

#ifndef _WIN32
	static int GetSyslogPriority (LogLevel level)
	{
		switch (level)
		{
			case eLogNone:    return LOG_CRIT;
			case eLogError:   return LOG_ERR;
			case eLogWarning: return LOG_WARNING;
			case eLogInfo:    return LOG_INFO;
			default:          return LOG_DEBUG;
		}
	}
#endif

	Log::Log ():
		m_Destination (eLogStdout), m_MinLevel (eLogInfo), m_LogStream (nullptr),
		m_HasColors (isatty (STDOUT_FILENO) != 0), m_IsHeld (false), m_LastTimestamp (0)
	{
		m_LastTime[0] = 0;
	}

	Log::~Log ()
	{
		Ready ();
#ifndef _WIN32
		if (m_Destination == eLogSyslog)
			closelog ();
#endif
		Flush ();
	}

	bool Log::SetLogLevel (const std::string& level)
	{
		for (int i = eLogNone; i < eNumLogLevels; i++)
			if (level == levelNames[i])
			{
				m_MinLevel = (LogLevel)i;
				LogPrint (eLogInfo, "Log: Min messages level set to ", level);
				return true;
			}
		LogPrint (eLogError, "Log: Unknown loglevel: ", level);
		return false;
	}

	const char * Log::TimeAsString (std::time_t t)
	{
		if (t != m_LastTimestamp)
		{
			struct tm tm;
			localtime_r (&t, &tm);
			strftime (m_LastTime, sizeof (m_LastTime), "%H:%M:%S", &tm);
			m_LastTimestamp = t;
		}
		return m_LastTime;
	}

	void Log::Write (const LogMsg& msg)
	{
		switch (m_Destination)
		{
#ifndef _WIN32
			case eLogSyslog:
				syslog (GetSyslogPriority (msg.level), "%s", msg.text.c_str ());
			break;
#endif
			case eLogFile:
			case eLogStream:
				if (m_LogStream)
				{
					*m_LogStream << TimeAsString (msg.timestamp) << "/" << levelNames[msg.level]
						<< " - " << msg.text << '\n';
					break;
				}
			// fall through
			default:
				std::cout << TimeAsString (msg.timestamp) << "/" << levelNames[msg.level]
					<< " - " << msg.text << '\n';
		}
	}

	void Log::Append (std::shared_ptr<LogMsg> msg)
	{
		std::lock_guard<std::mutex> l(m_OutputMutex);
		if (m_IsHeld)
			m_Held.Put (msg);
		else
			Write (*msg);
	}

	void Log::Hold ()
	{
		std::lock_guard<std::mutex> l(m_OutputMutex);
		m_IsHeld = true;
	}

	void Log::Ready ()
	{
		std::lock_guard<std::mutex> l(m_OutputMutex);
		while (auto msg = m_Held.Get ())
			Write (*msg);
		m_IsHeld = false;
	}

	void Log::Flush ()
	{
		std::lock_guard<std::mutex> l(m_OutputMutex);
		if (m_LogStream)
			m_LogStream->flush ();
		else
			std::cout.flush ();
	}

	void Log::SendTo (const std::string& path)
	{
		auto os = std::make_shared<std::ofstream> (path, std::ofstream::out | std::ofstream::app);
		if (!os->is_open ())
		{
			LogPrint (eLogError, "Log: Can't open file ", path);
			return;
		}
		std::lock_guard<std::mutex> l(m_OutputMutex);
		m_HasColors = false;
		m_Destination = eLogFile;
		m_LogStream = os;
	}

	void Log::SendTo (std::shared_ptr<std::ostream> os)
	{
		std::lock_guard<std::mutex> l(m_OutputMutex);
		m_HasColors = false;
		m_Destination = eLogStream;
		m_LogStream = os;
	}

#ifndef _WIN32
	void Log::SendTo (const char * name, int facility)
	{
		std::lock_guard<std::mutex> l(m_OutputMutex);
		m_HasColors = false;
		m_Destination = eLogSyslog;
		m_LogStream = nullptr;
		openlog (name, LOG_CONS | LOG_PID, facility);
	}
#endif

	Log & Logger ()
	{
		return logger;
	}

	const char * GetLevelColor (LogLevel level)
	{
		return levelColors[level];
	}

	const char * GetColorReset ()
	{
		return levelColors[eNumLogLevels];
	}
} // log
} // dragoman
