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

#include <gsl/gsl>

#include <cstddef>
#include <cstdio>
#include <string_view>

namespace fs
{
/// \brief Create the missing parent directories of a path
/// \param path_ File path
bool mkdirParent (std::string_view path_);

/// \brief Text file
class File
{
public:
	~File ();

	File ();

	File (File const &that_) = delete;

	File &operator= (File const &that_) = delete;

	/// \brief Whether the file is open
	explicit operator bool () const;

	/// \brief Open file
	/// \param path_ Path to open
	/// \param mode_ Access mode (\sa std::fopen)
	bool open (gsl::not_null<gsl::czstring> path_, gsl::not_null<gsl::czstring> mode_ = "rb");

	/// \brief Close file
	/// \retval false a buffered write failed
	bool close ();

	/// \brief Formatted write
	/// \param fmt_ Format
	__attribute__ ((format (printf, 2, 3))) bool printf (char const *fmt_, ...);

	/// \brief Read the next non-blank line
	/// \note Line terminators are stripped; returns empty at end-of-file. The view is
	/// valid until the next call.
	std::string_view readLine ();

private:
	/// \brief Underlying file
	gsl::owner<std::FILE *> m_fp = nullptr;

	/// \brief Line buffer
	gsl::owner<char *> m_lineBuffer = nullptr;

	/// \brief Line buffer size
	std::size_t m_lineBufferSize = 0;
};
}
