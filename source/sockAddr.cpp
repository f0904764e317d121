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

#include "sockAddr.h"

#include <arpa/inet.h>

#include <cerrno>
#include <cstring>
#include <string>

///////////////////////////////////////////////////////////////////////////
SockAddr::SockAddr () = default;

SockAddr::SockAddr (struct sockaddr_in const &addr_) : m_addr (addr_)
{
}

struct sockaddr *SockAddr::data ()
{
	return reinterpret_cast<struct sockaddr *> (&m_addr);
}

struct sockaddr const *SockAddr::data () const
{
	return reinterpret_cast<struct sockaddr const *> (&m_addr);
}

socklen_t SockAddr::size ()
{
	return sizeof (struct sockaddr_in);
}

int SockAddr::family () const
{
	return m_addr.sin_family;
}

std::uint16_t SockAddr::port () const
{
	if (m_addr.sin_family != AF_INET)
		return 0;

	return ntohs (m_addr.sin_port);
}

bool SockAddr::setPort (std::uint16_t const port_)
{
	if (m_addr.sin_family != AF_INET)
	{
		errno = EAFNOSUPPORT;
		return false;
	}

	m_addr.sin_port = htons (port_);
	return true;
}

bool SockAddr::octets (std::array<std::uint8_t, 4> &octets_) const
{
	if (m_addr.sin_family != AF_INET)
	{
		errno = EAFNOSUPPORT;
		return false;
	}

	// s_addr is stored in network order
	std::memcpy (octets_.data (), &m_addr.sin_addr.s_addr, octets_.size ());
	return true;
}

char const *SockAddr::name () const
{
	thread_local static char buffer[INET_ADDRSTRLEN];

	if (m_addr.sin_family != AF_INET || !inet_ntop (AF_INET, &m_addr.sin_addr, buffer, sizeof (buffer)))
		return "?";

	return buffer;
}

bool SockAddr::parse (std::string_view const host_, std::uint16_t const port_, SockAddr &addr_)
{
	auto const host = std::string (host_);

	struct sockaddr_in addr = {};
	if (inet_pton (AF_INET, host.c_str (), &addr.sin_addr) != 1)
	{
		errno = EINVAL;
		return false;
	}

	addr.sin_family = AF_INET;
	addr.sin_port   = htons (port_);

	addr_ = SockAddr (addr);
	return true;
}
