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

#include "fs.h"

#include "log.h"

#include <gsl/util>

#include <sys/stat.h>

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

bool fs::mkdirParent (std::string_view const path_)
{
	for (auto pos = path_.find ('/', 1); pos != std::string_view::npos; pos = path_.find ('/', pos + 1))
	{
		auto const dir = std::string (path_.substr (0, pos));
		if (::mkdir (dir.c_str (), 0755) != 0 && errno != EEXIST)
		{
			error ("mkdir %s: %s\n", dir.c_str (), std::strerror (errno));
			return false;
		}
	}

	return true;
}

///////////////////////////////////////////////////////////////////////////
fs::File::~File ()
{
	(void)close ();
	std::free (m_lineBuffer);
}

fs::File::File () = default;

fs::File::operator bool () const
{
	return m_fp != nullptr;
}

bool fs::File::open (gsl::not_null<gsl::czstring> const path_,
    gsl::not_null<gsl::czstring> const mode_)
{
	(void)close ();

	m_fp = std::fopen (path_, mode_);
	return m_fp != nullptr;
}

bool fs::File::close ()
{
	if (!m_fp)
		return true;

	auto const rc = std::fclose (m_fp);
	m_fp          = nullptr;
	if (rc != 0)
	{
		error ("fclose: %s\n", std::strerror (errno));
		return false;
	}

	return true;
}

bool fs::File::printf (char const *const fmt_, ...)
{
	if (!m_fp)
	{
		errno = EBADF;
		return false;
	}

	va_list ap;

	va_start (ap, fmt_);
	auto const rc = std::vfprintf (m_fp, fmt_, ap);
	va_end (ap);

	return rc >= 0;
}

std::string_view fs::File::readLine ()
{
	if (!m_fp)
		return {};

	while (true)
	{
		auto rc = ::getline (&m_lineBuffer, &m_lineBufferSize, m_fp);
		if (rc < 0)
			return {};

		while (rc > 0 && (m_lineBuffer[rc - 1] == '\r' || m_lineBuffer[rc - 1] == '\n'))
			m_lineBuffer[--rc] = '\0';

		if (rc > 0)
			return {m_lineBuffer, gsl::narrow_cast<std::size_t> (rc)};
	}
}
