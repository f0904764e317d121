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

#include "ftpConfig.h"

#include "fs.h"
#include "log.h"

#include <gsl/pointers>
#include <gsl/util>

#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace
{
constexpr std::uint16_t DEFAULT_PORT = 2121;
constexpr auto DEFAULT_USER          = "anonymous";
constexpr auto DEFAULT_PASS          = "anonymous";
constexpr auto DEFAULT_ADDRESS       = "0.0.0.0";

std::string_view strip (std::string_view const str_)
{
	auto const start = str_.find_first_not_of (" \t");
	if (start == std::string::npos)
		return {};

	auto const end = str_.find_last_not_of (" \t");
	return str_.substr (start, end + 1 - start);
}

template <typename T>
bool parseInt (T &out_, std::string_view const val_)
{
	auto const rc = std::from_chars (val_.data (), val_.data () + val_.size (), out_);
	if (rc.ec != std::errc{} || rc.ptr != val_.data () + val_.size ())
	{
		errno = EINVAL;
		return false;
	}

	return true;
}

bool validAddress (std::string_view const address_)
{
	SockAddr addr;
	return SockAddr::parse (address_, 0, addr);
}
}

///////////////////////////////////////////////////////////////////////////
FtpConfig::~FtpConfig () = default;

FtpConfig::FtpConfig ()
    : m_user (DEFAULT_USER),
      m_pass (DEFAULT_PASS),
      m_address (DEFAULT_ADDRESS),
      m_acceptTimeout (0),
      m_port (DEFAULT_PORT),
      m_logLevel (INFO)
{
}

UniqueFtpConfig FtpConfig::create ()
{
	return UniqueFtpConfig (new FtpConfig ());
}

UniqueFtpConfig FtpConfig::load (gsl::not_null<gsl::czstring> const path_)
{
	auto config = create ();

	auto fp = fs::File ();
	if (!fp.open (path_))
	{
		info ("Using default config; cannot open %s\n", path_.get ());
		return config;
	}

	std::string_view line;
	while (!(line = fp.readLine ()).empty ())
	{
		// comment
		if (strip (line).starts_with ('#'))
			continue;

		auto const pos = line.find_first_of ('=');
		if (pos == std::string::npos)
		{
			error ("Ignoring '%.*s'\n", gsl::narrow_cast<int> (line.size ()), line.data ());
			continue;
		}

		auto const key = strip (line.substr (0, pos));
		auto const val = strip (line.substr (pos + 1));
		if (key.empty ())
		{
			error ("Ignoring '%.*s'\n", gsl::narrow_cast<int> (line.size ()), line.data ());
			continue;
		}

		bool ok = true;
		if (key == "user")
			config->setUser (std::string (val));
		else if (key == "pass")
			config->setPass (std::string (val));
		else if (key == "address")
			ok = config->setAddress (val);
		else if (key == "port")
			ok = config->setPort (val);
		else if (key == "pasvAddress")
			ok = config->setPasvAddress (val);
		else if (key == "acceptTimeout")
			ok = config->setAcceptTimeout (val);
		else if (key == "logLevel")
			ok = config->setLogLevel (val);
		else
			error ("Ignoring unknown key '%.*s'\n", gsl::narrow_cast<int> (key.size ()), key.data ());

		if (!ok)
			error ("Invalid value for %.*s: %.*s\n",
			    gsl::narrow_cast<int> (key.size ()),
			    key.data (),
			    gsl::narrow_cast<int> (val.size ()),
			    val.data ());
	}

	return config;
}

bool FtpConfig::save (gsl::not_null<gsl::czstring> const path_)
{
	if (!fs::mkdirParent (path_.get ()))
		return false;

	auto fp = fs::File ();
	if (!fp.open (path_, "wb"))
	{
		error ("fopen %s: %s\n", path_.get (), std::strerror (errno));
		return false;
	}

	auto ok = fp.printf ("user=%s\n", m_user.c_str ());
	ok      = fp.printf ("pass=%s\n", m_pass.c_str ()) && ok;
	ok      = fp.printf ("address=%s\n", m_address.c_str ()) && ok;
	ok      = fp.printf ("port=%u\n", m_port) && ok;
	if (!m_pasvAddress.empty ())
		ok = fp.printf ("pasvAddress=%s\n", m_pasvAddress.c_str ()) && ok;
	ok = fp.printf ("acceptTimeout=%lld\n", static_cast<long long> (m_acceptTimeout.count ())) && ok;
	ok = fp.printf ("logLevel=%s\n", logLevelName (m_logLevel)) && ok;

	// flush errors surface on close
	if (!fp.close () || !ok)
	{
		error ("Failed to save %s\n", path_.get ());
		return false;
	}

	return true;
}

std::string const &FtpConfig::user () const
{
	return m_user;
}

std::string const &FtpConfig::pass () const
{
	return m_pass;
}

std::string const &FtpConfig::address () const
{
	return m_address;
}

std::uint16_t FtpConfig::port () const
{
	return m_port;
}

std::string const &FtpConfig::pasvAddress () const
{
	return m_pasvAddress;
}

std::chrono::seconds FtpConfig::acceptTimeout () const
{
	return m_acceptTimeout;
}

LogLevel FtpConfig::logLevel () const
{
	return m_logLevel;
}

bool FtpConfig::listenAddress (SockAddr &addr_) const
{
	return SockAddr::parse (m_address, m_port, addr_);
}

CredentialCheck FtpConfig::credentialCheck () const
{
	return [user = m_user, pass = m_pass] (std::string_view const user_,
	           std::string_view const pass_) {
		if (!user.empty () && user != user_)
			return false;

		return pass.empty () || pass == pass_;
	};
}

void FtpConfig::setUser (std::string user_)
{
	m_user = std::move (user_);
}

void FtpConfig::setPass (std::string pass_)
{
	m_pass = std::move (pass_);
}

bool FtpConfig::setAddress (std::string_view const address_)
{
	if (!validAddress (address_))
		return false;

	m_address = address_;
	return true;
}

bool FtpConfig::setPort (std::string_view const port_)
{
	std::uint16_t parsed{};
	if (!parseInt (parsed, port_))
		return false;

	return setPort (parsed);
}

bool FtpConfig::setPort (std::uint16_t const port_)
{
	m_port = port_;
	return true;
}

bool FtpConfig::setPasvAddress (std::string_view const address_)
{
	if (!address_.empty () && !validAddress (address_))
		return false;

	m_pasvAddress = address_;
	return true;
}

bool FtpConfig::setAcceptTimeout (std::string_view const seconds_)
{
	std::uint32_t parsed{};
	if (!parseInt (parsed, seconds_))
		return false;

	return setAcceptTimeout (std::chrono::seconds (parsed));
}

bool FtpConfig::setAcceptTimeout (std::chrono::seconds const timeout_)
{
	if (timeout_.count () < 0)
	{
		errno = EINVAL;
		return false;
	}

	m_acceptTimeout = timeout_;
	return true;
}

bool FtpConfig::setLogLevel (std::string_view const level_)
{
	LogLevel parsed;
	if (!parseLogLevel (level_, parsed))
	{
		errno = EINVAL;
		return false;
	}

	setLogLevel (parsed);
	return true;
}

void FtpConfig::setLogLevel (LogLevel const level_)
{
	m_logLevel = level_;
}
