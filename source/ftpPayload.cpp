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

#include "ftpPayload.h"

#include <algorithm>
#include <string>
#include <utility>

namespace
{
/// \brief Payload over an in-memory byte string
class CannedPayload : public PayloadSource
{
public:
	/// \brief Parameterized constructor
	/// \param bytes_ Payload bytes
	explicit CannedPayload (std::string bytes_) : m_bytes (std::move (bytes_))
	{
	}

	std::make_signed_t<std::size_t> read (IOBuffer &buffer_) override
	{
		auto const size =
		    buffer_.append (m_bytes.data () + m_offset, std::min (buffer_.freeSize (), m_bytes.size () - m_offset));
		m_offset += size;
		return static_cast<std::make_signed_t<std::size_t>> (size);
	}

private:
	/// \brief Payload bytes
	std::string const m_bytes;

	/// \brief Bytes already produced
	std::size_t m_offset = 0;
};
}

///////////////////////////////////////////////////////////////////////////
PayloadSource::~PayloadSource () = default;

std::string_view defaultListing ()
{
	return "-rw-r--r-- 1 ftp ftp 0 Jan 01 00:00 README\r\n";
}

UniquePayloadSource makeCannedPayload (std::string bytes_)
{
	return std::make_unique<CannedPayload> (std::move (bytes_));
}

PayloadFactory cannedPayloadFactory (std::string bytes_)
{
	return [bytes = std::move (bytes_)] (std::string_view) { return makeCannedPayload (bytes); };
}
