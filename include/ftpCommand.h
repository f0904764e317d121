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

#include <string>
#include <string_view>
#include <vector>

/// \brief Supported command verbs
enum class FtpVerb
{
	QUIT,
	USER,
	PASS,
	PASV,
	PORT,
	LIST,
};

/// \brief Verb table entry
struct FtpVerbSpec
{
	/// \brief Wire name
	std::string_view name;

	/// \brief Verb
	FtpVerb verb;

	/// \brief Declared arity
	unsigned arity;
};

/// \brief Parsed command
struct FtpCommand
{
	/// \brief Verb
	FtpVerb verb = FtpVerb::QUIT;

	/// \brief Arguments
	std::vector<std::string> args;

	/// \brief Argument or empty if absent
	/// \param index_ Argument index
	std::string_view arg (std::size_t index_ = 0) const;
};

/// \brief Command parse result
enum class FtpParseResult
{
	OK,
	SYNTAX_ERROR,
	UNKNOWN_COMMAND,
	ARITY_ERROR,
};

/// \brief Default verb table, sorted by name
std::vector<FtpVerbSpec> const &ftpVerbTable ();

/// \brief Get verb name
/// \param verb_ Verb
std::string_view ftpVerbName (FtpVerb verb_);

/// \brief Parse command line against the default verb table
/// \param line_ Line without delimiter
/// \param[out] command_ Parsed command
FtpParseResult parseFtpCommand (std::string_view line_, FtpCommand &command_);

/// \brief Parse command line
/// \param line_ Line without delimiter
/// \param table_ Verb table, sorted case-insensitively by name
/// \param[out] command_ Parsed command
/// \note command_ is only modified on success
FtpParseResult parseFtpCommand (std::string_view line_,
    std::vector<FtpVerbSpec> const &table_,
    FtpCommand &command_);
