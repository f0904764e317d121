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

#include <optional>
#include <string>
#include <string_view>

/// \brief Control channel response
class FtpResponse
{
public:
	/// \brief Response kind; the value is the reply code
	enum class Kind
	{
		DATA_OPEN         = 150,
		GREETING          = 220,
		GOODBYE           = 221,
		TRANSFER_COMPLETE = 226,
		PASSIVE_ADDRESS   = 227,
		LOGIN_OK          = 230,
		NEED_PASSWORD     = 331,
		UNAVAILABLE       = 421,
		NO_TRANSFER_MODE  = 425,
		SYNTAX_ERROR      = 500,
		BAD_ARITY         = 501,
		NOT_IMPLEMENTED   = 502,
		WRONG_SEQUENCE    = 503,
		DENIED            = 530,
	};

	/// \brief Parameterized constructor
	/// \param kind_ Response kind
	FtpResponse (Kind kind_);

	/// \brief Parameterized constructor
	/// \param kind_ Response kind
	/// \param message_ Message overriding the default text
	FtpResponse (Kind kind_, std::string message_);

	/// \brief Response kind
	Kind kind () const;

	/// \brief Reply code
	unsigned code () const;

	/// \brief Message text
	std::string_view message () const;

	/// \brief Wire form: "<code> <message>\r\n"
	/// \note A message already ending in CRLF is not terminated again
	std::string serialize () const;

	/// \brief Default message for a kind
	/// \param kind_ Response kind
	static std::string_view defaultMessage (Kind kind_);

private:
	/// \brief Response kind
	Kind m_kind;

	/// \brief Override message
	std::optional<std::string> m_message;
};
