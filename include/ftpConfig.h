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

#include "log.h"
#include "sockAddr.h"

#include <gsl/gsl>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

class FtpConfig;
using UniqueFtpConfig = std::unique_ptr<FtpConfig>;

/// \brief Credential validator
/// \param user_ User name
/// \param pass_ Secret
using CredentialCheck = std::function<bool (std::string_view user_, std::string_view pass_)>;

/// \brief FTP config
class FtpConfig
{
public:
	~FtpConfig ();

	/// \brief Create config
	static UniqueFtpConfig create ();

	/// \brief Load config
	/// \param path_ Path to config file
	/// \note A missing file yields the defaults
	static UniqueFtpConfig load (gsl::not_null<gsl::czstring> path_);

	/// \brief Save config
	/// \param path_ Path to config file
	bool save (gsl::not_null<gsl::czstring> path_);

	/// \brief Get user
	std::string const &user () const;

	/// \brief Get password
	std::string const &pass () const;

	/// \brief Get control listener bind address
	std::string const &address () const;

	/// \brief Get control listener port
	std::uint16_t port () const;

	/// \brief Get advertised passive address
	/// \note Empty means the local address of the control connection
	std::string const &pasvAddress () const;

	/// \brief Get passive accept timeout
	/// \note Zero means wait forever
	std::chrono::seconds acceptTimeout () const;

	/// \brief Get log level
	LogLevel logLevel () const;

	/// \brief Control listener address
	/// \param[out] addr_ Address to bind
	bool listenAddress (SockAddr &addr_) const;

	/// \brief Build credential validator for the configured identity
	/// \note Empty user or password accepts anything for that field
	CredentialCheck credentialCheck () const;

	/// \brief Set user
	/// \param user_ User
	void setUser (std::string user_);

	/// \brief Set password
	/// \param pass_ Password
	void setPass (std::string pass_);

	/// \brief Set control listener bind address
	/// \param address_ Dotted IPv4 address
	bool setAddress (std::string_view address_);

	/// \brief Set listen port
	/// \param port_ Listen port
	bool setPort (std::string_view port_);

	/// \brief Set listen port
	/// \param port_ Listen port
	bool setPort (std::uint16_t port_);

	/// \brief Set advertised passive address
	/// \param address_ Dotted IPv4 address, or empty
	bool setPasvAddress (std::string_view address_);

	/// \brief Set passive accept timeout
	/// \param seconds_ Timeout in seconds
	bool setAcceptTimeout (std::string_view seconds_);

	/// \brief Set passive accept timeout
	/// \param timeout_ Timeout
	bool setAcceptTimeout (std::chrono::seconds timeout_);

	/// \brief Set log level
	/// \param level_ Level name
	bool setLogLevel (std::string_view level_);

	/// \brief Set log level
	/// \param level_ Log level
	void setLogLevel (LogLevel level_);

private:
	FtpConfig ();

	/// \brief Username
	std::string m_user;

	/// \brief Password
	std::string m_pass;

	/// \brief Listen address
	std::string m_address;

	/// \brief Advertised passive address
	std::string m_pasvAddress;

	/// \brief Passive accept timeout
	std::chrono::seconds m_acceptTimeout;

	/// \brief Listen port
	std::uint16_t m_port;

	/// \brief Log level
	LogLevel m_logLevel;
};
