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

#include "ftpServer.h"

#include "log.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <functional>
#include <mutex>
#include <utility>
using namespace std::chrono_literals;

#define LOCKED(x)                                                                                  \
	do                                                                                             \
	{                                                                                              \
		auto const lock = std::scoped_lock (m_lock);                                               \
		x;                                                                                         \
	} while (0)

///////////////////////////////////////////////////////////////////////////
FtpServer::~FtpServer ()
{
	m_quit = true;
	if (m_thread.joinable ())
		m_thread.join ();

	std::vector<Worker> sessions;
	LOCKED (sessions = std::move (m_sessions));

	// unblock every session before waiting on any
	for (auto &worker : sessions)
		worker.session->abort ();

	for (auto &worker : sessions)
		worker.thread.join ();

	info ("Stopped server at [%s]:%u\n", m_socket->sockName ().name (), m_socket->sockName ().port ());
}

FtpServer::FtpServer (UniqueFtpConfig config_,
    UniqueSocket socket_,
    CredentialCheck credentialCheck_,
    PayloadFactory payloadFactory_)
    : m_config (std::move (config_)),
      m_socket (std::move (socket_)),
      m_credentialCheck (std::move (credentialCheck_)),
      m_payloadFactory (std::move (payloadFactory_)),
      m_quit (false)
{
	m_thread = platform::Thread (std::bind (&FtpServer::threadFunc, this));
}

UniqueFtpServer FtpServer::create (UniqueFtpConfig config_,
    CredentialCheck credentialCheck_,
    PayloadFactory payloadFactory_)
{
	if (!config_)
		config_ = FtpConfig::create ();

	SockAddr addr;
	if (!config_->listenAddress (addr))
	{
		error ("Invalid listen address %s\n", config_->address ().c_str ());
		return nullptr;
	}

	auto socket = Socket::listen (addr, 10);
	if (!socket)
		return nullptr;

	info ("Started server at [%s]:%u\n", socket->sockName ().name (), socket->sockName ().port ());

	if (!credentialCheck_)
		credentialCheck_ = config_->credentialCheck ();

	if (!payloadFactory_)
		payloadFactory_ = cannedPayloadFactory ();

	return UniqueFtpServer (new FtpServer (std::move (config_),
	    std::move (socket),
	    std::move (credentialCheck_),
	    std::move (payloadFactory_)));
}

SockAddr const &FtpServer::sockName () const
{
	return m_socket->sockName ();
}

std::size_t FtpServer::sessionCount () const
{
	auto const lock = std::scoped_lock (m_lock);
	auto const count =
	    std::count_if (std::begin (m_sessions), std::end (m_sessions), [] (auto const &worker_) {
		    return !worker_.session->dead ();
	    });

	return static_cast<std::size_t> (count);
}

void FtpServer::loop ()
{
	// poll listen socket
	auto const rc = m_socket->waitReadable (100ms);
	if (rc < 0 && errno != EINTR)
		platform::Thread::sleep (100ms);

	if (rc > 0)
	{
		auto socket = m_socket->accept ();
		if (socket)
		{
			auto session =
			    FtpSession::create (*m_config, std::move (socket), m_credentialCheck, m_payloadFactory);

			auto const raw = session.get ();
			auto thread    = platform::Thread ([raw] { raw->run (); });

			LOCKED (m_sessions.emplace_back (Worker{std::move (session), std::move (thread)}));
		}
	}

	reap ();
}

void FtpServer::reap ()
{
	std::vector<Worker> deadSessions;
	{
		// remove dead sessions
		auto const lock = std::scoped_lock (m_lock);
		auto it         = std::begin (m_sessions);
		while (it != std::end (m_sessions))
		{
			if (it->session->dead ())
			{
				deadSessions.emplace_back (std::move (*it));
				it = m_sessions.erase (it);
			}
			else
				++it;
		}
	}

	for (auto &worker : deadSessions)
		worker.thread.join ();
}

void FtpServer::threadFunc ()
{
	while (!m_quit)
		loop ();
}
