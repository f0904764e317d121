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

#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

#ifndef STATUS_STRING
#define STATUS_STRING "miniftpd"
#endif

#ifndef MINIFTPD_CONFIG
#define MINIFTPD_CONFIG "miniftpd.cfg"
#endif

namespace platform
{
/// \brief Install SIGINT/SIGTERM handlers and ignore SIGPIPE
bool init ();

/// \brief Wait one tick of the main loop
/// \returns false once termination was requested
bool loop ();

/// \brief Restore default signal handling
void exit ();

/// \brief Steady clock
using steady_clock = std::chrono::steady_clock;

/// \brief Joinable worker thread
/// \note A thread still running at destruction is joined
class Thread
{
public:
	~Thread ();

	Thread ();

	/// \brief Start a thread
	/// \param func_ Thread entry point
	explicit Thread (std::function<void ()> func_);

	Thread (Thread &&that_) = default;

	Thread &operator= (Thread &&that_);

	/// \brief Whether the thread can be joined
	bool joinable () const;

	/// \brief Wait for the thread to finish
	void join ();

	/// \brief Suspend the calling thread
	/// \param timeout_ Minimum time to sleep
	static void sleep (std::chrono::milliseconds timeout_);

private:
	/// \brief Underlying thread
	std::thread m_thread;
};

/// \brief Mutex usable with std::scoped_lock
class Mutex
{
public:
	/// \brief Lock mutex
	void lock ();

	/// \brief Unlock mutex
	void unlock ();

private:
	/// \brief Underlying mutex
	std::mutex m_mutex;
};
}
