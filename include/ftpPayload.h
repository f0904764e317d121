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

#pragma once

#include "ioBuffer.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

class PayloadSource;
using UniquePayloadSource = std::unique_ptr<PayloadSource>;

/// \brief Producer of data channel bytes
class PayloadSource
{
public:
	virtual ~PayloadSource ();

	/// \brief Fill the free area of a buffer
	/// \param buffer_ Buffer to fill
	/// \returns bytes produced, 0 at end, -1 on error (check errno)
	virtual std::make_signed_t<std::size_t> read (IOBuffer &buffer_) = 0;
};

/// \brief Payload provider for a data transfer command
/// \param args_ Command argument
/// \retval nullptr failure; check errno
using PayloadFactory = std::function<UniquePayloadSource (std::string_view args_)>;

/// \brief Default listing bytes
std::string_view defaultListing ();

/// \brief Create fixed payload source
/// \param bytes_ Payload bytes
UniquePayloadSource makeCannedPayload (std::string bytes_);

/// \brief Create payload provider that always yields the same bytes
/// \param bytes_ Payload bytes
PayloadFactory cannedPayloadFactory (std::string bytes_ = std::string (defaultListing ()));
