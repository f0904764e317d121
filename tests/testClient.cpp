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

#include "testClient.h"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <utility>

///////////////////////////////////////////////////////////////////////////
TestServer::TestServer (UniqueFtpConfig config_,
    CredentialCheck credentialCheck_,
    PayloadFactory payloadFactory_)
{
	config_->setAddress ("127.0.0.1");
	config_->setPort (std::uint16_t (0));

	m_server = FtpServer::create (
	    std::move (config_), std::move (credentialCheck_), std::move (payloadFactory_));
}

TestServer::operator bool () const
{
	return static_cast<bool> (m_server);
}

SockAddr TestServer::address () const
{
	return m_server->sockName ();
}

FtpServer &TestServer::server ()
{
	return *m_server;
}

void TestServer::stop ()
{
	m_server.reset ();
}

///////////////////////////////////////////////////////////////////////////
TestClient::TestClient () : m_buffer (4096)
{
}

std::string TestClient::connect (SockAddr const &addr_)
{
	m_socket = connectData (addr_);
	if (!m_socket)
		return {};

	return reply ();
}

bool TestClient::sendRaw (std::string_view const data_)
{
	return m_socket && m_socket->writeAll (data_.data (), data_.size ());
}

std::string TestClient::reply ()
{
	if (!m_socket)
		return {};

	while (true)
	{
		auto const buffer = m_buffer.usedArea ();
		auto const size   = m_buffer.usedSize ();
		auto const end    = std::string_view (buffer, size).find ("\r\n");
		if (end != std::string_view::npos)
		{
			auto line = std::string (buffer, end + 2);
			m_buffer.markFree (end + 2);
			m_buffer.coalesce ();
			return line;
		}

		m_buffer.coalesce ();
		if (m_buffer.freeSize () == 0 || !waitReadable (*m_socket))
			return {};

		if (m_socket->read (m_buffer) <= 0)
			return {};
	}
}

std::string TestClient::command (std::string_view const line_)
{
	auto data = std::string (line_);
	data += "\r\n";
	if (!sendRaw (data))
		return {};

	return reply ();
}

bool TestClient::closed ()
{
	if (!m_socket)
		return true;

	char c;
	return waitReadable (*m_socket) && m_socket->read (&c, 1) <= 0;
}

unsigned TestClient::code (std::string_view const reply_)
{
	unsigned code = 0;
	if (std::sscanf (std::string (reply_).c_str (), "%3u", &code) != 1)
		return 0;

	return code;
}

bool TestClient::parsePasv (std::string_view const reply_, SockAddr &addr_)
{
	auto const open = reply_.find ('(');
	if (open == std::string_view::npos)
		return false;

	unsigned h[4];
	unsigned p[2];
	auto const tuple = std::string (reply_.substr (open + 1));
	if (std::sscanf (tuple.c_str (), "%u,%u,%u,%u,%u,%u)", &h[0], &h[1], &h[2], &h[3], &p[0], &p[1]) !=
	    6)
		return false;

	char host[16];
	std::snprintf (host, sizeof (host), "%u.%u.%u.%u", h[0], h[1], h[2], h[3]);

	return SockAddr::parse (host, static_cast<std::uint16_t> (p[0] * 256 + p[1]), addr_);
}

UniqueSocket TestClient::connectData (SockAddr const &addr_)
{
	return Socket::connect (addr_);
}

bool TestClient::readAll (Socket &socket_, std::string &data_)
{
	char buffer[1024];
	while (waitReadable (socket_))
	{
		auto const rc = socket_.read (buffer, sizeof (buffer));
		if (rc < 0)
			return false;

		if (rc == 0)
			return true;

		data_.append (buffer, rc);
	}

	return false;
}

bool TestClient::waitReadable (Socket &socket_)
{
	return socket_.waitReadable (TIMEOUT) > 0;
}
