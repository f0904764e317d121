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

#include "ftpCommand.h"
#include "ftpConfig.h"
#include "ftpDataChannel.h"
#include "ftpPayload.h"
#include "ftpResponse.h"
#include "ioBuffer.h"
#include "platform.h"
#include "socket.h"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class FtpSession;
using UniqueFtpSession = std::unique_ptr<FtpSession>;

/// \brief FTP session
class FtpSession
{
public:
	~FtpSession ();

	/// \brief Login state
	enum class LoginState
	{
		UNAUTHENTICATED,
		USERNAME_PROVIDED,
		AUTHENTICATED,
	};

	/// \brief Run the control loop until quit or a fatal condition
	/// \note Blocks the calling thread; the control connection is closed on return
	void run ();

	/// \brief Abort the session
	/// \note Thread-safe; unblocks any pending control or data operation
	void abort ();

	/// \brief Whether the control loop has finished
	bool dead () const;

	/// \brief Create session
	/// \param config_ FTP config
	/// \param commandSocket_ Command socket
	/// \param credentialCheck_ Credential validator
	/// \param payloadFactory_ Data transfer payload provider
	static UniqueFtpSession create (FtpConfig const &config_,
	    UniqueSocket commandSocket_,
	    CredentialCheck credentialCheck_,
	    PayloadFactory payloadFactory_);

private:
	/// \brief Command buffer size
	constexpr static auto COMMAND_BUFFERSIZE = 4096;

	/// \brief Transfer buffersize
	constexpr static auto XFER_BUFFERSIZE = 65536;

	/// \brief Handler outcome
	struct Outcome
	{
		/// \brief Response to send
		FtpResponse response;

		/// \brief Whether the session ends after the response
		bool fatal = false;
	};

	/// \brief Parameterized constructor
	/// \param config_ FTP config
	/// \param commandSocket_ Command socket
	/// \param credentialCheck_ Credential validator
	/// \param payloadFactory_ Data transfer payload provider
	FtpSession (FtpConfig const &config_,
	    UniqueSocket commandSocket_,
	    CredentialCheck credentialCheck_,
	    PayloadFactory payloadFactory_);

	/// \brief Require an authenticated login
	/// \returns response to send when not authenticated
	std::optional<FtpResponse> checkAuthorized () const;

	/// \brief Read one command line
	/// \param[out] line_ Line without delimiter
	bool readCommand (std::string &line_);

	/// \brief Log a received command, masking USER and PASS arguments
	/// \param line_ Command line
	/// \param result_ Parse result
	/// \param command_ Parsed command, valid when result_ is OK
	void logCommand (std::string_view line_, FtpParseResult result_, FtpCommand const &command_);

	/// \brief Parse and run a command line
	/// \param line_ Command line
	Outcome dispatch (std::string_view line_);

	/// \brief Send response
	/// \param response_ Response to send
	bool sendResponse (FtpResponse const &response_);

	/// \brief Close sockets
	void close ();

	/// \brief Command socket
	SharedSocket m_commandSocket;

	/// \brief Passive data channel
	FtpDataChannel m_dataChannel;

	/// \brief Command buffer
	IOBuffer m_commandBuffer;

	/// \brief Transfer buffer
	IOBuffer m_xferBuffer;

	/// \brief FTP config
	FtpConfig const &m_config;

	/// \brief Credential validator
	CredentialCheck m_credentialCheck;

	/// \brief Payload provider
	PayloadFactory m_payloadFactory;

	/// \brief Mutex
	platform::Mutex m_lock;

	/// \brief Login state
	LoginState m_loginState = LoginState::UNAUTHENTICATED;

	/// \brief Provided or authenticated user name
	std::string m_user;

	/// \brief Whether abort was requested
	std::atomic<bool> m_quit = false;

	/// \brief Whether the control loop has finished
	std::atomic<bool> m_dead = false;

	/// \brief List directory
	/// \param command_ Command
	Outcome LIST (FtpCommand const &command_);

	/// \brief Password
	/// \param command_ Command
	Outcome PASS (FtpCommand const &command_);

	/// \brief Enter passive mode
	/// \param command_ Command
	Outcome PASV (FtpCommand const &command_);

	/// \brief Active mode
	/// \param command_ Command
	Outcome PORT (FtpCommand const &command_);

	/// \brief Terminate session
	/// \param command_ Command
	Outcome QUIT (FtpCommand const &command_);

	/// \brief User name
	/// \param command_ Command
	Outcome USER (FtpCommand const &command_);

	/// \brief Map of command handlers
	static std::vector<std::pair<FtpVerb, Outcome (FtpSession::*) (FtpCommand const &)>> const
	    handlers;
};
