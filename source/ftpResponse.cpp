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

#include "ftpResponse.h"

#include <string>
#include <utility>

///////////////////////////////////////////////////////////////////////////
FtpResponse::FtpResponse (Kind const kind_) : m_kind (kind_)
{
}

FtpResponse::FtpResponse (Kind const kind_, std::string message_)
    : m_kind (kind_), m_message (std::move (message_))
{
}

FtpResponse::Kind FtpResponse::kind () const
{
	return m_kind;
}

unsigned FtpResponse::code () const
{
	return static_cast<unsigned> (m_kind);
}

std::string_view FtpResponse::message () const
{
	if (m_message)
		return *m_message;

	return defaultMessage (m_kind);
}

std::string FtpResponse::serialize () const
{
	auto const message = this->message ();

	auto result = std::to_string (code ());
	result.push_back (' ');
	result.append (message);
	if (!message.ends_with ("\r\n"))
		result.append ("\r\n");

	return result;
}

std::string_view FtpResponse::defaultMessage (Kind const kind_)
{
	switch (kind_)
	{
	case Kind::DATA_OPEN:
		return "Opening data connection.";

	case Kind::GREETING:
		return "Service ready.";

	case Kind::GOODBYE:
		return "Goodbye.";

	case Kind::TRANSFER_COMPLETE:
		return "Transfer complete.";

	case Kind::PASSIVE_ADDRESS:
		return "Entering Passive Mode.";

	case Kind::LOGIN_OK:
		return "Login successful.";

	case Kind::NEED_PASSWORD:
		return "Need password.";

	case Kind::UNAVAILABLE:
		return "Service not available, closing control connection.";

	case Kind::NO_TRANSFER_MODE:
		return "Use PASV first.";

	case Kind::SYNTAX_ERROR:
		return "Command not understood.";

	case Kind::BAD_ARITY:
		return "Invalid number of arguments.";

	case Kind::NOT_IMPLEMENTED:
		return "Command not implemented.";

	case Kind::WRONG_SEQUENCE:
		return "Bad sequence of commands.";

	case Kind::DENIED:
		return "Not logged in.";
	}

	return "Unknown response.";
}
