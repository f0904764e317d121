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

#include "ftpDataChannel.h"

#include "log.h"

#include <sys/socket.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <utility>
using namespace std::chrono_literals;

#define LOCKED(x)                                                                                  \
	do                                                                                             \
	{                                                                                              \
		auto const lock = std::scoped_lock (m_lock);                                               \
		x;                                                                                         \
	} while (0)

namespace
{
/// \brief Poll slice for abortable waits
constexpr auto POLL_SLICE = 100ms;

/// \brief Time to wait for the peer to close after a transfer
constexpr auto CLOSE_WAIT = 1s;
}

///////////////////////////////////////////////////////////////////////////
FtpDataChannel::~FtpDataChannel () = default;

FtpDataChannel::FtpDataChannel () = default;

bool FtpDataChannel::listen (SockAddr const &addr_)
{
	// let the system pick an unused port
	auto addr = addr_;
	if (!addr.setPort (0))
	{
		error ("setPort: %s\n", std::strerror (errno));
		return false;
	}

	auto pasv = Socket::listen (addr, 1);
	if (!pasv)
		return false;

	info ("Listening on [%s]:%u\n", pasv->sockName ().name (), pasv->sockName ().port ());

	// replace the previous listener
	SharedSocket old;
	{
		auto const lock = std::scoped_lock (m_lock);
		old             = std::exchange (m_pasvSocket, std::move (pasv));
	}

	return true;
}

bool FtpDataChannel::listening () const
{
	auto const lock = std::scoped_lock (m_lock);
	return static_cast<bool> (m_pasvSocket);
}

std::uint16_t FtpDataChannel::port () const
{
	auto const lock = std::scoped_lock (m_lock);
	if (!m_pasvSocket)
		return 0;

	return m_pasvSocket->sockName ().port ();
}

SharedSocket FtpDataChannel::take ()
{
	auto const lock = std::scoped_lock (m_lock);
	return std::move (m_pasvSocket);
}

bool FtpDataChannel::accept (SharedSocket listener_, std::chrono::seconds const timeout_)
{
	if (!listener_)
	{
		errno = EINVAL;
		return false;
	}

	LOCKED (m_acceptSocket = listener_);

	auto const start = platform::steady_clock::now ();
	UniqueSocket data;
	while (!data)
	{
		if (m_aborted)
		{
			info ("Data connection aborted\n");
			break;
		}

		if (timeout_.count () > 0 && platform::steady_clock::now () - start >= timeout_)
		{
			error ("Timed out waiting for data connection\n");
			break;
		}

		auto const rc = listener_->waitReadable (POLL_SLICE);
		if (rc < 0 && errno == EINTR)
			continue;

		if (rc < 0)
			break;

		if (rc == 0)
			continue;

		data = listener_->accept ();
		if (!data)
			break;
	}

	// the listener serves one connection at most
	LOCKED (m_acceptSocket.reset ());
	listener_.reset ();

	if (!data)
		return false;

	LOCKED (m_dataSocket = std::move (data));

	// an abort may have raced the accept
	if (m_aborted)
	{
		LOCKED (m_dataSocket.reset ());
		return false;
	}

	return true;
}

bool FtpDataChannel::send (PayloadSource &source_, IOBuffer &buffer_)
{
	SharedSocket data;
	LOCKED (data = m_dataSocket);
	if (!data)
	{
		errno = ENOTCONN;
		return false;
	}

	std::size_t total = 0;

	buffer_.clear ();
	while (true)
	{
		auto const rc = source_.read (buffer_);
		if (rc < 0)
		{
			error ("Payload: %s\n", std::strerror (errno));
			return false;
		}

		if (rc == 0 && buffer_.empty ())
			break;

		while (!buffer_.empty ())
		{
			auto const bytes = data->write (buffer_);
			if (bytes <= 0)
				return false;

			total += bytes;
		}
	}

	debug ("Sent %zu bytes\n", total);
	return true;
}

void FtpDataChannel::finish ()
{
	SharedSocket data;
	LOCKED (data = std::move (m_dataSocket));
	if (!data)
		return;

	data->shutdown (SHUT_WR);

	// wait for the peer to acknowledge the end of data
	auto const start = platform::steady_clock::now ();
	while (!m_aborted && platform::steady_clock::now () - start < CLOSE_WAIT)
	{
		auto const rc = data->waitReadable (POLL_SLICE);
		if (rc < 0 && errno != EINTR)
			break;

		if (rc <= 0)
			continue;

		std::array<char, 512> discard;
		if (data->read (discard.data (), discard.size ()) <= 0)
			break;
	}
}

void FtpDataChannel::close ()
{
	SharedSocket pasv;
	SharedSocket data;
	{
		auto const lock = std::scoped_lock (m_lock);
		pasv            = std::move (m_pasvSocket);
		data            = std::move (m_dataSocket);
	}

	// reset an unfinished transfer
	if (data)
		data->setLinger (true, 0s);
}

void FtpDataChannel::abort ()
{
	m_aborted = true;

	auto const lock = std::scoped_lock (m_lock);
	if (m_acceptSocket)
		m_acceptSocket->shutdown (SHUT_RDWR);
	if (m_dataSocket)
		m_dataSocket->shutdown (SHUT_RDWR);
}

bool FtpDataChannel::formatAddress (SockAddr const &addr_,
    std::uint16_t const port_,
    std::string &tuple_)
{
	std::array<std::uint8_t, 4> octets;
	if (!addr_.octets (octets))
		return false;

	char buffer[32];
	auto const rc = std::snprintf (buffer,
	    sizeof (buffer),
	    "%u,%u,%u,%u,%u,%u",
	    octets[0],
	    octets[1],
	    octets[2],
	    octets[3],
	    port_ / 256u,
	    port_ % 256u);
	if (rc < 0 || static_cast<std::size_t> (rc) >= sizeof (buffer))
		return false;

	tuple_.assign (buffer, rc);
	return true;
}
