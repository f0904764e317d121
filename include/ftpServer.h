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

#include "ftpConfig.h"
#include "ftpPayload.h"
#include "ftpSession.h"
#include "platform.h"
#include "sockAddr.h"
#include "socket.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

class FtpServer;
using UniqueFtpServer = std::unique_ptr<FtpServer>;

/// \brief FTP server
class FtpServer
{
public:
	~FtpServer ();

	/// \brief Create server
	/// \param config_ FTP config
	/// \param credentialCheck_ Credential validator; empty uses the configured identity
	/// \param payloadFactory_ Data transfer payload provider; empty uses the default listing
	/// \retval nullptr failed to listen
	static UniqueFtpServer create (UniqueFtpConfig config_,
	    CredentialCheck credentialCheck_ = {},
	    PayloadFactory payloadFactory_   = {});

	/// \brief Listen address
	SockAddr const &sockName () const;

	/// \brief Number of live sessions
	std::size_t sessionCount () const;

private:
	/// \brief Session and the thread running it
	struct Worker
	{
		/// \brief Session
		UniqueFtpSession session;

		/// \brief Thread running the session
		platform::Thread thread;
	};

	/// \brief Paramterized constructor
	/// \param config_ FTP config
	/// \param socket_ Listen socket
	/// \param credentialCheck_ Credential validator
	/// \param payloadFactory_ Data transfer payload provider
	FtpServer (UniqueFtpConfig config_,
	    UniqueSocket socket_,
	    CredentialCheck credentialCheck_,
	    PayloadFactory payloadFactory_);

	/// \brief Server loop
	void loop ();

	/// \brief Join finished sessions
	void reap ();

	/// \brief Thread entry point
	void threadFunc ();

	/// \brief Mutex
	mutable platform::Mutex m_lock;

	/// \brief Config
	UniqueFtpConfig m_config;

	/// \brief Listen socket
	UniqueSocket m_socket;

	/// \brief Credential validator
	CredentialCheck m_credentialCheck;

	/// \brief Payload provider
	PayloadFactory m_payloadFactory;

	/// \brief Sessions
	std::vector<Worker> m_sessions;

	/// \brief Whether thread should quit
	std::atomic<bool> m_quit;

	/// \brief Thread
	platform::Thread m_thread;
};
