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

#include "platform.h"

#include "log.h"

#include <signal.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>
#include <utility>
using namespace std::chrono_literals;

namespace
{
/// \brief Whether termination was requested
volatile std::sig_atomic_t s_exitRequested = 0;

/// \brief Termination signal handler
/// \param signal_ Signal number
void handleSignal (int const signal_)
{
	(void)signal_;
	s_exitRequested = 1;
}
}

bool platform::init ()
{
	struct sigaction sa = {};
	sa.sa_handler       = handleSignal;
	::sigemptyset (&sa.sa_mask);

	if (::sigaction (SIGINT, &sa, nullptr) != 0 || ::sigaction (SIGTERM, &sa, nullptr) != 0)
	{
		error ("sigaction: %s\n", std::strerror (errno));
		return false;
	}

	// peer resets are reported through send() instead
	sa.sa_handler = SIG_IGN;
	if (::sigaction (SIGPIPE, &sa, nullptr) != 0)
	{
		error ("sigaction(SIGPIPE): %s\n", std::strerror (errno));
		return false;
	}

	return true;
}

bool platform::loop ()
{
	if (s_exitRequested)
		return false;

	Thread::sleep (100ms);
	return !s_exitRequested;
}

void platform::exit ()
{
	struct sigaction sa = {};
	sa.sa_handler       = SIG_DFL;
	::sigemptyset (&sa.sa_mask);

	(void)::sigaction (SIGINT, &sa, nullptr);
	(void)::sigaction (SIGTERM, &sa, nullptr);
}

///////////////////////////////////////////////////////////////////////////
platform::Thread::~Thread ()
{
	if (m_thread.joinable ())
		m_thread.join ();
}

platform::Thread::Thread () = default;

platform::Thread::Thread (std::function<void ()> func_) : m_thread (std::move (func_))
{
}

platform::Thread &platform::Thread::operator= (Thread &&that_)
{
	if (m_thread.joinable ())
		m_thread.join ();

	m_thread = std::move (that_.m_thread);
	return *this;
}

bool platform::Thread::joinable () const
{
	return m_thread.joinable ();
}

void platform::Thread::join ()
{
	m_thread.join ();
}

void platform::Thread::sleep (std::chrono::milliseconds const timeout_)
{
	std::this_thread::sleep_for (timeout_);
}

///////////////////////////////////////////////////////////////////////////
void platform::Mutex::lock ()
{
	m_mutex.lock ();
}

void platform::Mutex::unlock ()
{
	m_mutex.unlock ();
}
