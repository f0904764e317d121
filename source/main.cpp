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

#include "platform.h"

#include "ftpConfig.h"
#include "ftpServer.h"
#include "log.h"

#include <cstdio>
#include <cstdlib>
#include <utility>

int main (int argc_, char *argv_[])
{
	auto const path = argc_ > 1 ? argv_[1] : MINIFTPD_CONFIG;

	if (!platform::init ())
		return EXIT_FAILURE;

	auto config = FtpConfig::load (path);
	setLogLevel (config->logLevel ());

	info ("%s\n", STATUS_STRING);

	auto server = FtpServer::create (std::move (config));
	if (!server)
	{
		platform::exit ();
		return EXIT_FAILURE;
	}

	while (platform::loop ())
		;

	// stop sessions before restoring signal handlers
	server.reset ();

	platform::exit ();
}
