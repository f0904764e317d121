// miniftpd is a minimal FTP server implementation based on the following:
// - RFC  959 (https://tools.ietf.org/html/rfc959)
// - RFC 3659 (https://tools.ietf.org/html/rfc3659)
//
// Copyright (C) 2023 Michael Theall
// Copyright (C) 2026 miniftpd contributors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "log.h"

#include "platform.h"

#include <strings.h>

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstring>
#include <deque>
#include <mutex>
#include <utility>

namespace
{
/// \brief History entries kept for getLog
constexpr std::size_t MAX_HISTORY = 10000;

/// \brief Message prefix
char const *const s_prefix[] = {
    [DEBUG]    = "[DEBUG]",
    [INFO]     = "[INFO]",
    [ERROR]    = "[ERROR]",
    [COMMAND]  = "[COMMAND]",
    [RESPONSE] = "[RESPONSE]",
};

/// \brief Stored log entry
struct Entry
{
	LogLevel level;
	std::string text;
};

/// \brief Log history, oldest first
std::deque<Entry> s_history;

/// \brief Minimum log level
std::atomic<LogLevel> s_level = INFO;

/// \brief Log lock
platform::Mutex s_lock;

/// \brief Whether a message at this level should be emitted
/// \param level_ Log level
bool enabled (LogLevel const level_)
{
#ifdef NDEBUG
	if (level_ == DEBUG)
		return false;
#endif

	auto const minimum = s_level.load (std::memory_order_relaxed);

	// protocol traffic is informational
	if (level_ == COMMAND || level_ == RESPONSE)
		return minimum <= INFO;

	return level_ >= minimum;
}

/// \brief Store and print a message
/// \param level_ Log level
/// \param message_ Log message
/// \note s_lock must be held
void emit (LogLevel const level_, std::string message_)
{
	std::fputs (s_prefix[level_], stderr);
	std::fputc (' ', stderr);
	std::fwrite (message_.data (), 1, message_.size (), stderr);
	if (message_.empty () || message_.back () != '\n')
		std::fputc ('\n', stderr);

	while (s_history.size () >= MAX_HISTORY)
		s_history.pop_front ();

	s_history.push_back (Entry{level_, std::move (message_)});
}
}

void setLogLevel (LogLevel const level_)
{
	s_level.store (level_, std::memory_order_relaxed);
}

LogLevel logLevel ()
{
	return s_level.load (std::memory_order_relaxed);
}

bool parseLogLevel (std::string_view const name_, LogLevel &level_)
{
	for (auto const level : {DEBUG, INFO, ERROR})
	{
		if (name_.size () == std::strlen (logLevelName (level)) &&
		    ::strncasecmp (name_.data (), logLevelName (level), name_.size ()) == 0)
		{
			level_ = level;
			return true;
		}
	}

	return false;
}

char const *logLevelName (LogLevel const level_)
{
	switch (level_)
	{
	case DEBUG:
		return "debug";

	case INFO:
		return "info";

	case ERROR:
		return "error";

	case COMMAND:
		return "command";

	case RESPONSE:
		return "response";
	}

	return "unknown";
}

std::string getLog ()
{
	auto const lock = std::scoped_lock (s_lock);

	std::string out;
	for (auto const &entry : s_history)
	{
		out.append (s_prefix[entry.level]).append (1, ' ').append (entry.text);
		if (out.back () != '\n')
			out.push_back ('\n');
	}

	return out;
}

void clearLog ()
{
	auto const lock = std::scoped_lock (s_lock);
	s_history.clear ();
}

void debug (char const *const fmt_, ...)
{
#ifndef NDEBUG
	va_list ap;

	va_start (ap, fmt_);
	addLog (DEBUG, fmt_, ap);
	va_end (ap);
#endif
}

void info (char const *const fmt_, ...)
{
	va_list ap;

	va_start (ap, fmt_);
	addLog (INFO, fmt_, ap);
	va_end (ap);
}

void error (char const *const fmt_, ...)
{
	va_list ap;

	va_start (ap, fmt_);
	addLog (ERROR, fmt_, ap);
	va_end (ap);
}

void addLog (LogLevel const level_, char const *const fmt_, va_list ap_)
{
	if (!enabled (level_))
		return;

	thread_local static char buffer[1024];

	std::vsnprintf (buffer, sizeof (buffer), fmt_, ap_);

	auto const lock = std::scoped_lock (s_lock);
	emit (level_, buffer);
}

void addLog (LogLevel const level_, std::string_view const message_)
{
	if (!enabled (level_))
		return;

	// embedded NULs would truncate stderr output
	auto text = std::string (message_);
	std::replace (std::begin (text), std::end (text), '\0', '?');

	auto const lock = std::scoped_lock (s_lock);
	emit (level_, std::move (text));
}
