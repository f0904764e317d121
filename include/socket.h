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

#include "ioBuffer.h"
#include "sockAddr.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <type_traits>

class Socket;
using UniqueSocket = std::unique_ptr<Socket>;
using SharedSocket = std::shared_ptr<Socket>;

/// \brief Blocking IPv4 TCP socket
/// \note shutdown() may be called from another thread to unblock a pending call
class Socket
{
public:
	~Socket ();

	Socket (Socket const &that_) = delete;

	Socket &operator= (Socket const &that_) = delete;

	/// \brief Create a listening socket
	/// \param addr_ Address to bind; port 0 requests an ephemeral port
	/// \param backlog_ Queue size for incoming connections
	/// \retval nullptr failure; check errno
	static UniqueSocket listen (SockAddr const &addr_, int backlog_);

	/// \brief Create a connected socket
	/// \param addr_ Peer address
	/// \retval nullptr failure; check errno
	static UniqueSocket connect (SockAddr const &addr_);

	/// \brief Accept connection
	/// \retval nullptr failure; check errno
	UniqueSocket accept ();

	/// \brief Wait until the socket is readable or in error
	/// \param timeout_ Time to wait
	/// \returns 1 ready, 0 timeout, -1 error
	int waitReadable (std::chrono::milliseconds timeout_);

	/// \brief Read data
	/// \param buffer_ Output buffer
	/// \param size_ Size to read
	/// \returns bytes read, 0 on orderly shutdown, -1 on error
	std::make_signed_t<std::size_t> read (void *buffer_, std::size_t size_);

	/// \brief Read data into the free area of a buffer
	/// \param buffer_ Output buffer
	std::make_signed_t<std::size_t> read (IOBuffer &buffer_);

	/// \brief Write from the used area of a buffer
	/// \param buffer_ Input buffer
	/// \note Can return partial writes; written data is consumed from buffer_
	std::make_signed_t<std::size_t> write (IOBuffer &buffer_);

	/// \brief Write all data
	/// \param buffer_ Input buffer
	/// \param size_ Size to write
	bool writeAll (void const *buffer_, std::size_t size_);

	/// \brief Shutdown socket
	/// \param how_ Type of shutdown (\sa ::shutdown)
	bool shutdown (int how_);

	/// \brief Set linger option
	/// \param enable_ Whether to enable linger
	/// \param time_ Linger timeout
	bool setLinger (bool enable_, std::chrono::seconds time_);

	/// \brief Local name
	SockAddr const &sockName () const;

	/// \brief Peer name
	SockAddr const &peerName () const;

private:
	/// \brief Parameterized constructor
	/// \param fd_ Socket fd
	explicit Socket (int fd_);

	/// \brief Create an unbound socket
	static UniqueSocket create ();

	/// \brief Send data
	/// \param buffer_ Input buffer
	/// \param size_ Size to send
	std::make_signed_t<std::size_t> send (void const *buffer_, std::size_t size_);

	/// \brief Local name
	SockAddr m_sockName;

	/// \brief Peer name
	SockAddr m_peerName;

	/// \brief Socket fd
	int const m_fd;

	/// \brief Whether listening
	bool m_listening = false;

	/// \brief Whether connected
	bool m_connected = false;
};
