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

#include "ftpSession.h"

#include "log.h"

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>

#define LOCKED(x)                                                                                  \
	do                                                                                             \
	{                                                                                              \
		auto const lock = std::scoped_lock (m_lock);                                               \
		x;                                                                                         \
	} while (0)

namespace
{
/// \brief Parse command
/// \param buffer_ Buffer to parse
/// \param size_ Size of buffer
/// \returns {delimiterPos, nextPos}
std::pair<char *, char *> parseCommand (char *const buffer_, std::size_t const size_)
{
	// look for \r\n or \n delimiter
	auto const end = &buffer_[size_];
	for (auto p = buffer_; p < end; ++p)
	{
		if (p[0] == '\r' && p < end - 1 && p[1] == '\n')
			return {p, &p[2]};

		if (p[0] == '\n')
			return {p, &p[1]};
	}

	return {nullptr, nullptr};
}
}

///////////////////////////////////////////////////////////////////////////
FtpSession::~FtpSession ()
{
	close ();
}

FtpSession::FtpSession (FtpConfig const &config_,
    UniqueSocket commandSocket_,
    CredentialCheck credentialCheck_,
    PayloadFactory payloadFactory_)
    : m_commandSocket (std::move (commandSocket_)),
      m_commandBuffer (COMMAND_BUFFERSIZE),
      m_xferBuffer (XFER_BUFFERSIZE),
      m_config (config_),
      m_credentialCheck (std::move (credentialCheck_)),
      m_payloadFactory (std::move (payloadFactory_))
{
}

UniqueFtpSession FtpSession::create (FtpConfig const &config_,
    UniqueSocket commandSocket_,
    CredentialCheck credentialCheck_,
    PayloadFactory payloadFactory_)
{
	return UniqueFtpSession (new FtpSession (config_,
	    std::move (commandSocket_),
	    std::move (credentialCheck_),
	    std::move (payloadFactory_)));
}

void FtpSession::run ()
{
	if (sendResponse (FtpResponse (FtpResponse::Kind::GREETING)))
	{
		std::string line;
		while (!m_quit && readCommand (line))
		{
			auto const outcome = dispatch (line);
			if (!sendResponse (outcome.response) || outcome.fatal)
				break;
		}
	}

	close ();
	m_dead = true;
}

void FtpSession::abort ()
{
	m_quit = true;

	LOCKED (if (m_commandSocket) m_commandSocket->shutdown (SHUT_RDWR));
	m_dataChannel.abort ();
}

bool FtpSession::dead () const
{
	return m_dead;
}

std::optional<FtpResponse> FtpSession::checkAuthorized () const
{
	if (m_loginState == LoginState::AUTHENTICATED)
		return std::nullopt;

	return FtpResponse (FtpResponse::Kind::DENIED);
}

bool FtpSession::readCommand (std::string &line_)
{
	while (true)
	{
		auto const buffer        = m_commandBuffer.usedArea ();
		auto const size          = m_commandBuffer.usedSize ();
		auto const [delim, next] = parseCommand (buffer, size);
		if (next)
		{
			line_.assign (buffer, delim);
			m_commandBuffer.markFree (next - buffer);
			m_commandBuffer.coalesce ();
			return true;
		}

		// prepare to receive data
		m_commandBuffer.coalesce ();
		if (m_commandBuffer.freeSize () == 0)
		{
			error ("Exceeded command buffer size %zu\n", m_commandBuffer.capacity ());
			return false;
		}

		auto const rc = m_commandSocket->read (m_commandBuffer);
		if (rc < 0)
			return false;

		if (rc == 0)
		{
			// peer closed connection
			info ("Peer [%s]:%u closed connection\n",
			    m_commandSocket->peerName ().name (),
			    m_commandSocket->peerName ().port ());
			return false;
		}
	}
}

void FtpSession::logCommand (std::string_view const line_,
    FtpParseResult const result_,
    FtpCommand const &command_)
{
	// credentials never reach the log
	if (result_ == FtpParseResult::OK && !command_.args.empty () &&
	    (command_.verb == FtpVerb::USER || command_.verb == FtpVerb::PASS))
	{
		addLog (COMMAND, std::string (ftpVerbName (command_.verb)) + " ******");
		return;
	}

	addLog (COMMAND, line_);
}

FtpSession::Outcome FtpSession::dispatch (std::string_view const line_)
{
	FtpCommand command;
	auto const result = parseFtpCommand (line_, command);
	logCommand (line_, result, command);

	switch (result)
	{
	case FtpParseResult::OK:
		break;

	case FtpParseResult::SYNTAX_ERROR:
	case FtpParseResult::UNKNOWN_COMMAND:
		return {FtpResponse (FtpResponse::Kind::SYNTAX_ERROR)};

	case FtpParseResult::ARITY_ERROR:
		return {FtpResponse (FtpResponse::Kind::BAD_ARITY)};
	}

	auto const it = std::find_if (std::begin (handlers),
	    std::end (handlers),
	    [&command] (auto const &entry_) { return entry_.first == command.verb; });
	if (it == std::end (handlers))
		return {FtpResponse (FtpResponse::Kind::NOT_IMPLEMENTED)};

	auto const handler = it->second;
	return (this->*handler) (command);
}

bool FtpSession::sendResponse (FtpResponse const &response_)
{
	if (!m_commandSocket)
		return false;

	auto const wire = response_.serialize ();
	addLog (RESPONSE, wire);

	return m_commandSocket->writeAll (wire.data (), wire.size ());
}

void FtpSession::close ()
{
	m_dataChannel.close ();

	SharedSocket command;
	LOCKED (command = std::move (m_commandSocket));
	if (command)
		command->shutdown (SHUT_RDWR);
}

///////////////////////////////////////////////////////////////////////////
FtpSession::Outcome FtpSession::LIST (FtpCommand const &command_)
{
	if (auto const denied = checkAuthorized ())
		return {*denied};

	// a listener serves one transfer, successful or not
	auto listener = m_dataChannel.take ();
	if (!listener)
		return {FtpResponse (FtpResponse::Kind::NO_TRANSFER_MODE)};

	if (!m_dataChannel.accept (std::move (listener), m_config.acceptTimeout ()))
		return {FtpResponse (FtpResponse::Kind::UNAVAILABLE, "Failed to establish data connection."),
		    true};

	if (!sendResponse (FtpResponse (FtpResponse::Kind::DATA_OPEN)))
	{
		m_dataChannel.close ();
		return {FtpResponse (FtpResponse::Kind::UNAVAILABLE), true};
	}

	auto const source = m_payloadFactory ? m_payloadFactory (command_.arg ()) : nullptr;
	if (!source)
	{
		error ("No payload for %s\n", std::string (ftpVerbName (command_.verb)).c_str ());
		m_dataChannel.close ();
		return {FtpResponse (FtpResponse::Kind::UNAVAILABLE, "Failed to read data."), true};
	}

	if (!m_dataChannel.send (*source, m_xferBuffer))
	{
		m_dataChannel.close ();
		return {FtpResponse (FtpResponse::Kind::UNAVAILABLE, "Data transfer failed."), true};
	}

	m_dataChannel.finish ();
	return {FtpResponse (FtpResponse::Kind::TRANSFER_COMPLETE)};
}

FtpSession::Outcome FtpSession::PASS (FtpCommand const &command_)
{
	switch (m_loginState)
	{
	case LoginState::UNAUTHENTICATED:
		return {FtpResponse (FtpResponse::Kind::WRONG_SEQUENCE, "Login with USER first.")};

	case LoginState::AUTHENTICATED:
		return {FtpResponse (FtpResponse::Kind::LOGIN_OK, "Already logged in.")};

	case LoginState::USERNAME_PROVIDED:
		break;
	}

	if (m_credentialCheck && m_credentialCheck (m_user, command_.arg ()))
	{
		info ("User %s logged in\n", m_user.c_str ());
		m_loginState = LoginState::AUTHENTICATED;
		return {FtpResponse (FtpResponse::Kind::LOGIN_OK)};
	}

	info ("Login incorrect for %s\n", m_user.c_str ());
	m_loginState = LoginState::UNAUTHENTICATED;
	m_user.clear ();
	return {FtpResponse (FtpResponse::Kind::DENIED, "Login incorrect.")};
}

FtpSession::Outcome FtpSession::PASV (FtpCommand const &command_)
{
	(void)command_;

	if (auto const denied = checkAuthorized ())
		return {*denied};

	// listen on the interface the client reached us on
	if (!m_dataChannel.listen (m_commandSocket->sockName ()))
		return {FtpResponse (FtpResponse::Kind::UNAVAILABLE, "Failed to enter passive mode."), true};

	auto advertised = m_commandSocket->sockName ();
	if (!m_config.pasvAddress ().empty () &&
	    !SockAddr::parse (m_config.pasvAddress (), 0, advertised))
	{
		error ("Invalid passive address %s\n", m_config.pasvAddress ().c_str ());
		return {FtpResponse (FtpResponse::Kind::UNAVAILABLE, "Failed to enter passive mode."), true};
	}

	std::string tuple;
	if (!FtpDataChannel::formatAddress (advertised, m_dataChannel.port (), tuple))
	{
		error ("Cannot advertise address %s\n", advertised.name ());
		return {FtpResponse (FtpResponse::Kind::UNAVAILABLE, "Failed to enter passive mode."), true};
	}

	return {FtpResponse (FtpResponse::Kind::PASSIVE_ADDRESS, "Entering Passive Mode (" + tuple + ").")};
}

FtpSession::Outcome FtpSession::PORT (FtpCommand const &command_)
{
	(void)command_;

	return {FtpResponse (FtpResponse::Kind::NOT_IMPLEMENTED, "Active mode not implemented.")};
}

FtpSession::Outcome FtpSession::QUIT (FtpCommand const &command_)
{
	(void)command_;

	return {FtpResponse (FtpResponse::Kind::GOODBYE), true};
}

FtpSession::Outcome FtpSession::USER (FtpCommand const &command_)
{
	if (m_loginState == LoginState::AUTHENTICATED)
		return {FtpResponse (FtpResponse::Kind::DENIED, "Cannot change user.")};

	m_user       = command_.arg ();
	m_loginState = LoginState::USERNAME_PROVIDED;
	return {FtpResponse (FtpResponse::Kind::NEED_PASSWORD)};
}

// clang-format off
std::vector<std::pair<FtpVerb, FtpSession::Outcome (FtpSession::*) (FtpCommand const &)>> const
    FtpSession::handlers =
{
	{FtpVerb::LIST, &FtpSession::LIST},
	{FtpVerb::PASS, &FtpSession::PASS},
	{FtpVerb::PASV, &FtpSession::PASV},
	{FtpVerb::PORT, &FtpSession::PORT},
	{FtpVerb::QUIT, &FtpSession::QUIT},
	{FtpVerb::USER, &FtpSession::USER},
};
// clang-format on
