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

#include "socket.h"

#include "log.h"

#include <gsl/util>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cerrno>
#include <cstring>

///////////////////////////////////////////////////////////////////////////
Socket::~Socket ()
{
	if (m_listening)
		info ("Stop listening on [%s]:%u\n", m_sockName.name (), m_sockName.port ());

	if (m_connected)
		info ("Closing connection to [%s]:%u\n", m_peerName.name (), m_peerName.port ());

	if (::close (m_fd) != 0)
		error ("close: %s\n", std::strerror (errno));
}

Socket::Socket (int const fd_) : m_fd (fd_)
{
}

UniqueSocket Socket::create ()
{
	auto const fd = ::socket (AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
	if (fd < 0)
	{
		error ("socket: %s\n", std::strerror (errno));
		return nullptr;
	}

	return UniqueSocket (new Socket (fd));
}

UniqueSocket Socket::listen (SockAddr const &addr_, int const backlog_)
{
	auto socket = create ();
	if (!socket)
		return nullptr;

	// a fixed port must be reusable across restarts
	if (addr_.port () != 0)
	{
		int const reuse = 1;
		if (::setsockopt (socket->m_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof (reuse)) != 0)
		{
			error ("setsockopt(SO_REUSEADDR): %s\n", std::strerror (errno));
			return nullptr;
		}
	}

	if (::bind (socket->m_fd, addr_.data (), SockAddr::size ()) != 0)
	{
		error ("bind [%s]:%u: %s\n", addr_.name (), addr_.port (), std::strerror (errno));
		return nullptr;
	}

	// learn the ephemeral port
	socklen_t addrLen = SockAddr::size ();
	if (::getsockname (socket->m_fd, socket->m_sockName.data (), &addrLen) != 0)
	{
		error ("getsockname: %s\n", std::strerror (errno));
		return nullptr;
	}

	if (::listen (socket->m_fd, backlog_) != 0)
	{
		error ("listen: %s\n", std::strerror (errno));
		return nullptr;
	}

	socket->m_listening = true;
	return socket;
}

UniqueSocket Socket::connect (SockAddr const &addr_)
{
	auto socket = create ();
	if (!socket)
		return nullptr;

	int rc;
	do
		rc = ::connect (socket->m_fd, addr_.data (), SockAddr::size ());
	while (rc != 0 && errno == EINTR);

	if (rc != 0)
	{
		error ("connect [%s]:%u: %s\n", addr_.name (), addr_.port (), std::strerror (errno));
		return nullptr;
	}

	socklen_t addrLen = SockAddr::size ();
	if (::getsockname (socket->m_fd, socket->m_sockName.data (), &addrLen) != 0)
		error ("getsockname: %s\n", std::strerror (errno));

	socket->m_peerName  = addr_;
	socket->m_connected = true;
	return socket;
}

UniqueSocket Socket::accept ()
{
	SockAddr peer;
	socklen_t addrLen = SockAddr::size ();

	int fd;
	do
		fd = ::accept4 (m_fd, peer.data (), &addrLen, SOCK_CLOEXEC);
	while (fd < 0 && errno == EINTR);

	if (fd < 0)
	{
		error ("accept: %s\n", std::strerror (errno));
		return nullptr;
	}

	auto socket = UniqueSocket (new Socket (fd));

	// the listener may be bound to a wildcard address
	addrLen = SockAddr::size ();
	if (::getsockname (fd, socket->m_sockName.data (), &addrLen) != 0)
	{
		error ("getsockname: %s\n", std::strerror (errno));
		socket->m_sockName = m_sockName;
	}

	socket->m_peerName  = peer;
	socket->m_connected = true;

	info ("Accepted connection from [%s]:%u\n", peer.name (), peer.port ());
	return socket;
}

int Socket::waitReadable (std::chrono::milliseconds const timeout_)
{
	struct pollfd pfd = {};
	pfd.fd            = m_fd;
	pfd.events        = POLLIN;

	auto const rc = ::poll (&pfd, 1, gsl::narrow_cast<int> (timeout_.count ()));
	if (rc < 0)
	{
		if (errno != EINTR)
			error ("poll: %s\n", std::strerror (errno));
		return -1;
	}

	return rc > 0 ? 1 : 0;
}

std::make_signed_t<std::size_t> Socket::read (void *const buffer_, std::size_t const size_)
{
	assert (buffer_);
	assert (size_);

	std::make_signed_t<std::size_t> rc;
	do
		rc = ::recv (m_fd, buffer_, size_, 0);
	while (rc < 0 && errno == EINTR);

	if (rc < 0)
		error ("recv: %s\n", std::strerror (errno));

	return rc;
}

std::make_signed_t<std::size_t> Socket::read (IOBuffer &buffer_)
{
	assert (buffer_.freeSize () > 0);

	auto const rc = read (buffer_.freeArea (), buffer_.freeSize ());
	if (rc > 0)
		buffer_.markUsed (rc);

	return rc;
}

std::make_signed_t<std::size_t> Socket::send (void const *const buffer_, std::size_t const size_)
{
	std::make_signed_t<std::size_t> rc;
	do
		rc = ::send (m_fd, buffer_, size_, MSG_NOSIGNAL);
	while (rc < 0 && errno == EINTR);

	if (rc < 0)
		error ("send: %s\n", std::strerror (errno));

	return rc;
}

std::make_signed_t<std::size_t> Socket::write (IOBuffer &buffer_)
{
	assert (buffer_.usedSize () > 0);

	auto const rc = send (buffer_.usedArea (), buffer_.usedSize ());
	if (rc > 0)
		buffer_.markFree (rc);

	return rc;
}

bool Socket::writeAll (void const *const buffer_, std::size_t const size_)
{
	auto const p = static_cast<char const *> (buffer_);

	std::size_t bytes = 0;
	while (bytes < size_)
	{
		auto const rc = send (p + bytes, size_ - bytes);
		if (rc <= 0)
			return false;

		bytes += rc;
	}

	return true;
}

bool Socket::shutdown (int const how_)
{
	if (::shutdown (m_fd, how_) != 0)
	{
		// already disconnected
		if (errno == ENOTCONN)
			return true;

		error ("shutdown: %s\n", std::strerror (errno));
		return false;
	}

	return true;
}

bool Socket::setLinger (bool const enable_, std::chrono::seconds const time_)
{
	struct linger linger;
	linger.l_onoff  = enable_;
	linger.l_linger = gsl::narrow_cast<int> (time_.count ());

	if (::setsockopt (m_fd, SOL_SOCKET, SO_LINGER, &linger, sizeof (linger)) != 0)
	{
		error ("setsockopt(SO_LINGER): %s\n", std::strerror (errno));
		return false;
	}

	return true;
}

SockAddr const &Socket::sockName () const
{
	return m_sockName;
}

SockAddr const &Socket::peerName () const
{
	return m_peerName;
}
