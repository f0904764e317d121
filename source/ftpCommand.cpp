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

#include "ftpCommand.h"

#include <strings.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace
{
/// \brief Whether a character is ASCII whitespace
bool isSpace (char const c_)
{
	return c_ == ' ' || c_ == '\t' || c_ == '\r' || c_ == '\n' || c_ == '\v' || c_ == '\f';
}

/// \brief Split on ASCII whitespace
std::vector<std::string_view> tokenize (std::string_view const line_)
{
	std::vector<std::string_view> tokens;

	std::size_t pos = 0;
	while (pos < line_.size ())
	{
		while (pos < line_.size () && isSpace (line_[pos]))
			++pos;

		auto const start = pos;
		while (pos < line_.size () && !isSpace (line_[pos]))
			++pos;

		if (pos > start)
			tokens.emplace_back (line_.substr (start, pos - start));
	}

	return tokens;
}

/// \brief Join tokens with single spaces
std::string join (std::vector<std::string_view>::const_iterator begin_,
    std::vector<std::string_view>::const_iterator const end_)
{
	std::string result;
	for (; begin_ != end_; ++begin_)
	{
		if (!result.empty ())
			result.push_back (' ');
		result.append (*begin_);
	}

	return result;
}

int compareVerb (std::string_view const lhs_, std::string_view const rhs_)
{
	auto const rc = ::strncasecmp (lhs_.data (), rhs_.data (), std::min (lhs_.size (), rhs_.size ()));
	if (rc != 0)
		return rc;

	if (lhs_.size () == rhs_.size ())
		return 0;

	return lhs_.size () < rhs_.size () ? -1 : 1;
}
}

///////////////////////////////////////////////////////////////////////////
std::string_view FtpCommand::arg (std::size_t const index_) const
{
	if (index_ >= args.size ())
		return {};

	return args[index_];
}

std::vector<FtpVerbSpec> const &ftpVerbTable ()
{
	// clang-format off
	static std::vector<FtpVerbSpec> const table = {
	    {"LIST", FtpVerb::LIST, 0},
	    {"PASS", FtpVerb::PASS, 1},
	    {"PASV", FtpVerb::PASV, 0},
	    {"PORT", FtpVerb::PORT, 1},
	    {"QUIT", FtpVerb::QUIT, 0},
	    {"USER", FtpVerb::USER, 1},
	};
	// clang-format on

	return table;
}

std::string_view ftpVerbName (FtpVerb const verb_)
{
	for (auto const &entry : ftpVerbTable ())
	{
		if (entry.verb == verb_)
			return entry.name;
	}

	return "?";
}

FtpParseResult parseFtpCommand (std::string_view const line_, FtpCommand &command_)
{
	return parseFtpCommand (line_, ftpVerbTable (), command_);
}

FtpParseResult parseFtpCommand (std::string_view const line_,
    std::vector<FtpVerbSpec> const &table_,
    FtpCommand &command_)
{
	auto const tokens = tokenize (line_);
	if (tokens.empty ())
		return FtpParseResult::SYNTAX_ERROR;

	auto const it = std::lower_bound (std::begin (table_),
	    std::end (table_),
	    tokens.front (),
	    [] (auto const &lhs_, auto const &rhs_) { return compareVerb (lhs_.name, rhs_) < 0; });

	if (it == std::end (table_) || compareVerb (it->name, tokens.front ()) != 0)
		return FtpParseResult::UNKNOWN_COMMAND;

	auto const first     = std::next (std::begin (tokens));
	auto const remaining = tokens.size () - 1;

	std::vector<std::string> args;
	if (it->arity == 0)
	{
		// optional trailing text
		if (remaining > 0)
			args.emplace_back (join (first, std::end (tokens)));
	}
	else
	{
		if (remaining < it->arity)
			return FtpParseResult::ARITY_ERROR;

		auto const last = std::next (first, it->arity - 1);
		for (auto p = first; p != last; ++p)
			args.emplace_back (*p);

		// excess tokens fold into the final argument
		args.emplace_back (join (last, std::end (tokens)));
	}

	command_.verb = it->verb;
	command_.args = std::move (args);
	return FtpParseResult::OK;
}
