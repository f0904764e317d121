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

#include "ftpConfig.h"
#include "ftpPayload.h"
#include "ftpServer.h"
#include "ioBuffer.h"
#include "sockAddr.h"
#include "socket.h"

#include <chrono>
#include <string>
#include <string_view>

/// \brief Server on an ephemeral loopback port, owned by one test
class TestServer
{
public:
	/// \brief Parameterized constructor
	/// \param config_ FTP config; listen address and port are overridden
	/// \param credentialCheck_ Credential validator
	/// \param payloadFactory_ Payload provider
	explicit TestServer (UniqueFtpConfig config_ = FtpConfig::create (),
	    CredentialCheck credentialCheck_        = {},
	    PayloadFactory payloadFactory_          = {});

	/// \brief Whether the server started
	explicit operator bool () const;

	/// \brief Address clients connect to
	SockAddr address () const;

	/// \brief Server
	FtpServer &server ();

	/// \brief Stop the server
	void stop ();

private:
	/// \brief Server
	UniqueFtpServer m_server;
};

/// \brief Blocking control channel client
class TestClient
{
public:
	/// \brief Reply timeout
	constexpr static auto TIMEOUT = std::chrono::seconds (5);

	TestClient ();

	/// \brief Connect and read the greeting
	/// \param addr_ Server address
	/// \returns greeting reply, empty on failure
	std::string connect (SockAddr const &addr_);

	/// \brief Send a raw string
	/// \param data_ Data to send
	bool sendRaw (std::string_view data_);

	/// \brief Read one reply line including CRLF
	/// \returns reply, empty on timeout or close
	std::string reply ();

	/// \brief Send a command line and read the reply
	/// \param line_ Command without delimiter
	std::string command (std::string_view line_);

	/// \brief Wait for the server to close the control connection
	bool closed ();

	/// \brief Reply code
	/// \param reply_ Reply line
	static unsigned code (std::string_view reply_);

	/// \brief Parse a 227 reply
	/// \param reply_ Reply line
	/// \param[out] addr_ Advertised address
	static bool parsePasv (std::string_view reply_, SockAddr &addr_);

	/// \brief Connect a data socket
	/// \param addr_ Address to connect
	static UniqueSocket connectData (SockAddr const &addr_);

	/// \brief Read until the peer closes
	/// \param socket_ Socket to read
	/// \param[out] data_ Data read
	static bool readAll (Socket &socket_, std::string &data_);

private:
	/// \brief Wait for the socket to become readable
	/// \param socket_ Socket to wait on
	static bool waitReadable (Socket &socket_);

	/// \brief Control socket
	UniqueSocket m_socket;

	/// \brief Reply buffer
	IOBuffer m_buffer;
};
