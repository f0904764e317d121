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

#include <netinet/in.h>
#include <sys/socket.h>

#include <array>
#include <cstdint>
#include <string_view>

/// \brief IPv4 socket address
class SockAddr
{
public:
	SockAddr ();

	/// \brief Parameterized constructor
	/// \param addr_ Address
	SockAddr (struct sockaddr_in const &addr_);

	/// \brief Address for the socket API
	struct sockaddr *data ();

	/// \brief Address for the socket API
	struct sockaddr const *data () const;

	/// \brief Size of the address for the socket API
	static socklen_t size ();

	/// \brief Address family; AF_INET once set
	int family () const;

	/// \brief Port in host order
	std::uint16_t port () const;

	/// \brief Set port
	/// \param port_ Port in host order
	bool setPort (std::uint16_t port_);

	/// \brief Address octets, most significant first
	/// \param[out] octets_ Octets
	bool octets (std::array<std::uint8_t, 4> &octets_) const;

	/// \brief Dotted address, "?" if unset
	/// \note The string lives in a thread-local buffer until the next call
	char const *name () const;

	/// \brief Parse a dotted IPv4 address
	/// \param host_ Address string
	/// \param port_ Port in host order
	/// \param[out] addr_ Parsed address
	static bool parse (std::string_view host_, std::uint16_t port_, SockAddr &addr_);

private:
	/// \brief Address storage
	struct sockaddr_in m_addr = {};
};
