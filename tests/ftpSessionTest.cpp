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

#include "ftpConfig.h"
#include "ftpPayload.h"
#include "ftpServer.h"
#include "log.h"
#include "platform.h"
#include "testClient.h"

#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
using namespace std::chrono_literals;

namespace
{
/// \brief Session test fixture
class FtpSessionTest : public ::testing::Test
{
protected:
	void SetUp () override
	{
		ASSERT_TRUE (m_server);
		ASSERT_EQ (TestClient::code (m_client.connect (m_server.address ())), 220u);
	}

	/// \brief Log in with the default identity
	void login ()
	{
		ASSERT_EQ (TestClient::code (m_client.command ("USER anonymous")), 331u);
		ASSERT_EQ (TestClient::code (m_client.command ("PASS anonymous")), 230u);
	}

	/// \brief Enter passive mode
	/// \param[out] addr_ Advertised address
	void enterPassive (SockAddr &addr_)
	{
		auto const reply = m_client.command ("PASV");
		ASSERT_EQ (TestClient::code (reply), 227u) << reply;
		ASSERT_TRUE (TestClient::parsePasv (reply, addr_)) << reply;
	}

	/// \brief Server
	TestServer m_server;

	/// \brief Client
	TestClient m_client;
};

/// \brief Payload source that always fails
class FailingPayload : public PayloadSource
{
public:
	std::make_signed_t<std::size_t> read (IOBuffer &buffer_) override
	{
		(void)buffer_;

		errno = EIO;
		return -1;
	}
};

/// \brief Wait until a condition holds
/// \param pred_ Condition
template <typename Pred>
bool eventually (Pred &&pred_)
{
	auto const start = platform::steady_clock::now ();
	while (platform::steady_clock::now () - start < 5s)
	{
		if (pred_ ())
			return true;

		platform::Thread::sleep (10ms);
	}

	return false;
}
}

TEST_F (FtpSessionTest, LoginSucceeds)
{
	login ();
}

TEST_F (FtpSessionTest, UserMayBeReplacedBeforePass)
{
	EXPECT_EQ (TestClient::code (m_client.command ("USER root")), 331u);
	EXPECT_EQ (TestClient::code (m_client.command ("USER anonymous")), 331u);
	EXPECT_EQ (TestClient::code (m_client.command ("PASS anonymous")), 230u);
}

TEST_F (FtpSessionTest, PassBeforeUser)
{
	EXPECT_EQ (TestClient::code (m_client.command ("PASS anonymous")), 503u);

	// still unauthenticated
	EXPECT_EQ (TestClient::code (m_client.command ("PASV")), 530u);
}

TEST_F (FtpSessionTest, WrongPasswordResetsLogin)
{
	EXPECT_EQ (TestClient::code (m_client.command ("USER anonymous")), 331u);
	EXPECT_EQ (TestClient::code (m_client.command ("PASS nope")), 530u);

	// the user name was discarded
	EXPECT_EQ (TestClient::code (m_client.command ("PASS anonymous")), 503u);
	EXPECT_EQ (TestClient::code (m_client.command ("LIST")), 530u);
}

TEST_F (FtpSessionTest, UnknownUserIsRejectedAtPass)
{
	EXPECT_EQ (TestClient::code (m_client.command ("USER mallory")), 331u);
	EXPECT_EQ (TestClient::code (m_client.command ("PASS anonymous")), 530u);
}

TEST_F (FtpSessionTest, AuthenticatedIsSticky)
{
	login ();

	EXPECT_EQ (TestClient::code (m_client.command ("PASS whatever")), 230u);
	EXPECT_EQ (TestClient::code (m_client.command ("USER other")), 530u);

	// still logged in as before
	EXPECT_EQ (TestClient::code (m_client.command ("LIST")), 425u);
}

TEST_F (FtpSessionTest, PrivilegedCommandsRequireLogin)
{
	EXPECT_EQ (TestClient::code (m_client.command ("PASV")), 530u);
	EXPECT_EQ (TestClient::code (m_client.command ("LIST")), 530u);

	EXPECT_EQ (TestClient::code (m_client.command ("USER anonymous")), 331u);
	EXPECT_EQ (TestClient::code (m_client.command ("LIST")), 530u);

	// the provided user name survives the denial
	EXPECT_EQ (TestClient::code (m_client.command ("PASS anonymous")), 230u);
}

TEST_F (FtpSessionTest, SyntaxErrors)
{
	EXPECT_EQ (TestClient::code (m_client.command ("")), 500u);
	EXPECT_EQ (TestClient::code (m_client.command ("FOO arg1 arg2")), 500u);
	EXPECT_EQ (TestClient::code (m_client.command ("USER")), 501u);
	EXPECT_EQ (TestClient::code (m_client.command ("PASS")), 501u);

	// the session survives
	login ();
}

TEST_F (FtpSessionTest, PortIsNotImplemented)
{
	EXPECT_EQ (TestClient::code (m_client.command ("PORT 127,0,0,1,4,1")), 502u);

	login ();
	EXPECT_EQ (TestClient::code (m_client.command ("PORT 127,0,0,1,4,1")), 502u);
	EXPECT_EQ (TestClient::code (m_client.command ("LIST")), 425u);
}

TEST_F (FtpSessionTest, ListWithoutPassive)
{
	login ();

	EXPECT_EQ (TestClient::code (m_client.command ("LIST")), 425u);
	EXPECT_EQ (TestClient::code (m_client.command ("LIST")), 425u);
}

TEST_F (FtpSessionTest, RepeatedPassiveReplacesListener)
{
	login ();

	SockAddr first;
	SockAddr second;
	enterPassive (first);
	enterPassive (second);

	EXPECT_NE (first.port (), second.port ());
	EXPECT_FALSE (TestClient::connectData (first));

	auto data = TestClient::connectData (second);
	ASSERT_TRUE (data);
}

TEST_F (FtpSessionTest, PassiveAdvertisesControlAddress)
{
	login ();

	SockAddr addr;
	enterPassive (addr);
	EXPECT_STREQ (addr.name (), "127.0.0.1");
	EXPECT_NE (addr.port (), 0);
}

TEST_F (FtpSessionTest, EndToEnd)
{
	login ();

	SockAddr addr;
	enterPassive (addr);

	auto data = TestClient::connectData (addr);
	ASSERT_TRUE (data);

	EXPECT_EQ (TestClient::code (m_client.command ("LIST")), 150u);

	std::string payload;
	ASSERT_TRUE (TestClient::readAll (*data, payload));
	EXPECT_EQ (payload, defaultListing ());
	data.reset ();

	EXPECT_EQ (TestClient::code (m_client.reply ()), 226u);

	// the listener was consumed
	EXPECT_EQ (TestClient::code (m_client.command ("LIST")), 425u);

	EXPECT_EQ (TestClient::code (m_client.command ("QUIT")), 221u);
	EXPECT_TRUE (m_client.closed ());
}

TEST_F (FtpSessionTest, PipelinedCommands)
{
	ASSERT_TRUE (m_client.sendRaw ("USER anonymous\r\nPASS anonymous\nQUIT\r\n"));

	EXPECT_EQ (TestClient::code (m_client.reply ()), 331u);
	EXPECT_EQ (TestClient::code (m_client.reply ()), 230u);
	EXPECT_EQ (TestClient::code (m_client.reply ()), 221u);
	EXPECT_TRUE (m_client.closed ());
}

TEST_F (FtpSessionTest, QuitWithTrailingText)
{
	EXPECT_EQ (TestClient::code (m_client.command ("quit see you")), 221u);
	EXPECT_TRUE (m_client.closed ());
}

TEST_F (FtpSessionTest, OverlongCommandClosesSession)
{
	ASSERT_TRUE (m_client.sendRaw (std::string (8192, 'A')));
	EXPECT_TRUE (m_client.closed ());
}

TEST_F (FtpSessionTest, CredentialsAreMaskedInLog)
{
	clearLog ();
	login ();

	auto const log = getLog ();
	EXPECT_NE (log.find ("USER ******"), std::string::npos);
	EXPECT_NE (log.find ("PASS ******"), std::string::npos);
	EXPECT_EQ (log.find ("PASS anonymous"), std::string::npos);
	EXPECT_NE (log.find ("230 "), std::string::npos);
}

TEST_F (FtpSessionTest, CredentialsAreMaskedAfterLeadingWhitespace)
{
	clearLog ();
	EXPECT_EQ (TestClient::code (m_client.command (" USER anonymous")), 331u);
	EXPECT_EQ (TestClient::code (m_client.command ("\t pass s3cret")), 530u);

	auto const log = getLog ();
	EXPECT_EQ (log.find ("s3cret"), std::string::npos);
	EXPECT_NE (log.find ("USER ******"), std::string::npos);
	EXPECT_NE (log.find ("PASS ******"), std::string::npos);
}

TEST_F (FtpSessionTest, CommandLogKeepsWholeLine)
{
	clearLog ();

	auto const withNul = std::string ("NOOP\0tail", 9);
	EXPECT_EQ (TestClient::code (m_client.command (withNul)), 500u);

	auto const longLine = "XLONG " + std::string (2000, 'a') + "z";
	EXPECT_EQ (TestClient::code (m_client.command (longLine)), 500u);

	auto const log = getLog ();
	EXPECT_NE (log.find ("NOOP?tail"), std::string::npos);
	EXPECT_NE (log.find (longLine), std::string::npos);
}

TEST (FtpServer, CustomCollaborators)
{
	std::string seenArgs;
	auto server = TestServer (FtpConfig::create (),
	    [] (std::string_view const user_, std::string_view const pass_) {
		    return user_ == "carol" && pass_ == "open sesame";
	    },
	    [&seenArgs] (std::string_view const args_) {
		    seenArgs = args_;
		    return makeCannedPayload ("hello\r\n");
	    });
	ASSERT_TRUE (server);

	TestClient client;
	ASSERT_EQ (TestClient::code (client.connect (server.address ())), 220u);
	EXPECT_EQ (TestClient::code (client.command ("USER anonymous")), 331u);
	EXPECT_EQ (TestClient::code (client.command ("PASS anonymous")), 530u);
	EXPECT_EQ (TestClient::code (client.command ("USER carol")), 331u);
	EXPECT_EQ (TestClient::code (client.command ("PASS open sesame")), 230u);

	auto const reply = client.command ("PASV");
	SockAddr addr;
	ASSERT_TRUE (TestClient::parsePasv (reply, addr)) << reply;

	auto data = TestClient::connectData (addr);
	ASSERT_TRUE (data);
	EXPECT_EQ (TestClient::code (client.command ("LIST -l /pub")), 150u);

	std::string payload;
	ASSERT_TRUE (TestClient::readAll (*data, payload));
	data.reset ();

	EXPECT_EQ (payload, "hello\r\n");
	EXPECT_EQ (TestClient::code (client.reply ()), 226u);
	EXPECT_EQ (seenArgs, "-l /pub");
}

TEST (FtpServer, PayloadFailureIsFatal)
{
	auto server = TestServer (FtpConfig::create (), {}, [] (std::string_view) {
		return UniquePayloadSource (std::make_unique<FailingPayload> ());
	});
	ASSERT_TRUE (server);

	TestClient client;
	ASSERT_EQ (TestClient::code (client.connect (server.address ())), 220u);
	ASSERT_EQ (TestClient::code (client.command ("USER anonymous")), 331u);
	ASSERT_EQ (TestClient::code (client.command ("PASS anonymous")), 230u);

	SockAddr addr;
	ASSERT_TRUE (TestClient::parsePasv (client.command ("PASV"), addr));

	auto data = TestClient::connectData (addr);
	ASSERT_TRUE (data);
	EXPECT_EQ (TestClient::code (client.command ("LIST")), 150u);
	EXPECT_EQ (TestClient::code (client.reply ()), 421u);
	EXPECT_TRUE (client.closed ());
}

TEST (FtpServer, AcceptTimeoutIsFatal)
{
	auto config = FtpConfig::create ();
	ASSERT_TRUE (config->setAcceptTimeout (1s));

	auto server = TestServer (std::move (config));
	ASSERT_TRUE (server);

	TestClient client;
	ASSERT_EQ (TestClient::code (client.connect (server.address ())), 220u);
	ASSERT_EQ (TestClient::code (client.command ("USER anonymous")), 331u);
	ASSERT_EQ (TestClient::code (client.command ("PASS anonymous")), 230u);
	ASSERT_EQ (TestClient::code (client.command ("PASV")), 227u);

	// never connect the data channel
	EXPECT_EQ (TestClient::code (client.command ("LIST")), 421u);
	EXPECT_TRUE (client.closed ());
}

TEST (FtpServer, AdvertisedPassiveAddress)
{
	auto config = FtpConfig::create ();
	ASSERT_TRUE (config->setPasvAddress ("10.1.2.3"));

	auto server = TestServer (std::move (config));
	ASSERT_TRUE (server);

	TestClient client;
	ASSERT_EQ (TestClient::code (client.connect (server.address ())), 220u);
	ASSERT_EQ (TestClient::code (client.command ("USER anonymous")), 331u);
	ASSERT_EQ (TestClient::code (client.command ("PASS anonymous")), 230u);

	auto const reply = client.command ("PASV");
	EXPECT_NE (reply.find ("(10,1,2,3,"), std::string::npos) << reply;
}

TEST (FtpServer, ConcurrentSessions)
{
	auto server = TestServer ();
	ASSERT_TRUE (server);

	TestClient first;
	TestClient second;
	ASSERT_EQ (TestClient::code (first.connect (server.address ())), 220u);
	ASSERT_EQ (TestClient::code (second.connect (server.address ())), 220u);
	EXPECT_TRUE (eventually ([&server] { return server.server ().sessionCount () == 2; }));

	// a session blocked in a passive accept does not stall the other
	ASSERT_EQ (TestClient::code (first.command ("USER anonymous")), 331u);
	ASSERT_EQ (TestClient::code (first.command ("PASS anonymous")), 230u);
	ASSERT_EQ (TestClient::code (first.command ("PASV")), 227u);
	ASSERT_TRUE (first.sendRaw ("LIST\r\n"));

	EXPECT_EQ (TestClient::code (second.command ("USER anonymous")), 331u);
	EXPECT_EQ (TestClient::code (second.command ("QUIT")), 221u);
	EXPECT_TRUE (second.closed ());
	EXPECT_TRUE (eventually ([&server] { return server.server ().sessionCount () == 1; }));

	// stopping the server aborts the blocked session
	server.stop ();
	EXPECT_TRUE (first.closed ());
}
