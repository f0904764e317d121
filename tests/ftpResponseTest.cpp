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

#include <gtest/gtest.h>

#include <string>

using Kind = FtpResponse::Kind;

TEST (FtpResponse, DefaultMessage)
{
	auto const response = FtpResponse (Kind::SYNTAX_ERROR);
	EXPECT_EQ (response.code (), 500u);
	EXPECT_EQ (response.serialize (), "500 Command not understood.\r\n");
}

TEST (FtpResponse, OverrideMessage)
{
	auto const response = FtpResponse (Kind::PASSIVE_ADDRESS, "Entering Passive Mode (127,0,0,1,4,1).");
	EXPECT_EQ (response.kind (), Kind::PASSIVE_ADDRESS);
	EXPECT_EQ (response.message (), "Entering Passive Mode (127,0,0,1,4,1).");
	EXPECT_EQ (response.serialize (), "227 Entering Passive Mode (127,0,0,1,4,1).\r\n");
}

TEST (FtpResponse, TerminatedMessageIsNotTerminatedTwice)
{
	EXPECT_EQ (FtpResponse (Kind::GOODBYE, "Bye\r\n").serialize (), "221 Bye\r\n");

	// a bare LF is not a terminator
	EXPECT_EQ (FtpResponse (Kind::GOODBYE, "Bye\n").serialize (), "221 Bye\n\r\n");
}

TEST (FtpResponse, Codes)
{
	struct
	{
		Kind kind;
		unsigned code;
	} const expected[] = {
	    {Kind::DATA_OPEN, 150},
	    {Kind::GREETING, 220},
	    {Kind::GOODBYE, 221},
	    {Kind::TRANSFER_COMPLETE, 226},
	    {Kind::PASSIVE_ADDRESS, 227},
	    {Kind::LOGIN_OK, 230},
	    {Kind::NEED_PASSWORD, 331},
	    {Kind::UNAVAILABLE, 421},
	    {Kind::NO_TRANSFER_MODE, 425},
	    {Kind::SYNTAX_ERROR, 500},
	    {Kind::BAD_ARITY, 501},
	    {Kind::NOT_IMPLEMENTED, 502},
	    {Kind::WRONG_SEQUENCE, 503},
	    {Kind::DENIED, 530},
	};

	for (auto const &entry : expected)
	{
		auto const response = FtpResponse (entry.kind);
		EXPECT_EQ (response.code (), entry.code);
		EXPECT_FALSE (response.message ().empty ());
		EXPECT_EQ (response.serialize ().substr (0, 4), std::to_string (entry.code) + " ");
	}
}

TEST (FtpResponse, ArityMessage)
{
	EXPECT_EQ (FtpResponse (Kind::BAD_ARITY).serialize (), "501 Invalid number of arguments.\r\n");
}
