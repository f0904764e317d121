// miniftpd is a minimal FTP server implementation based on the following:
// - RFC  959 (https://tools.ietf.org/html/rfc959)
// - RFC 3659 (https://tools.ietf.org/html/rfc3659)
//
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

#include "ftpPayload.h"
#include "ioBuffer.h"
#include "platform.h"
#include "sockAddr.h"
#include "socket.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

/// \brief Passive data channel of one session
/// \note At most one listener is held; a listener serves exactly one connection
class FtpDataChannel
{
public:
	~FtpDataChannel ();

	FtpDataChannel ();

	FtpDataChannel (FtpDataChannel const &that_) = delete;

	FtpDataChannel &operator= (FtpDataChannel const &that_) = delete;

	/// \brief Open a passive listener on an ephemeral port
	/// \param addr_ Local address to bind; the port is ignored
	/// \note The previous listener is closed only if the new one succeeds
	bool listen (SockAddr const &addr_);

	/// \brief Whether a passive listener is held
	bool listening () const;

	/// \brief Port of the held listener, 0 if none
	std::uint16_t port () const;

	/// \brief Take the held listener, leaving none
	SharedSocket take ();

	/// \brief Wait for exactly one connection on a listener
	/// \param listener_ Listener to accept on
	/// \param timeout_ Time to wait; zero waits until aborted
	/// \retval false timeout, abort or failure
	/// \note The accepted socket becomes the current data connection; the listener is
	/// released either way
	bool accept (SharedSocket listener_, std::chrono::seconds timeout_);

	/// \brief Stream a payload to the current data connection
	/// \param source_ Payload source
	/// \param buffer_ Transfer buffer
	bool send (PayloadSource &source_, IOBuffer &buffer_);

	/// \brief Close the current data connection
	/// \note Shuts down writing and waits briefly for the peer to close
	void finish ();

	/// \brief Close listener and data connection
	/// \note An open data connection is reset
	void close ();

	/// \brief Abort any blocking operation
	/// \note Thread-safe; further accepts fail
	void abort ();

	/// \brief Format the passive reply tuple h1,h2,h3,h4,p1,p2
	/// \param addr_ Advertised IPv4 address
	/// \param port_ Advertised port
	/// \param[out] tuple_ Formatted tuple
	/// \retval false address is not IPv4
	static bool formatAddress (SockAddr const &addr_, std::uint16_t port_, std::string &tuple_);

private:
	/// \brief Mutex
	mutable platform::Mutex m_lock;

	/// \brief Passive listener
	SharedSocket m_pasvSocket;

	/// \brief Listener being accepted on
	SharedSocket m_acceptSocket;

	/// \brief Data connection
	SharedSocket m_dataSocket;

	/// \brief Whether aborted
	std::atomic<bool> m_aborted = false;
};
