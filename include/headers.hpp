/******************************************************************************
*
*	CAEN SpA - Software Division
*	Via Vetraia, 11 - 55049 - Viareggio ITALY
*	+39 0594 388 398 - www.caen.it
*
*******************************************************************************
*
*	Copyright (C) 2020-2023 CAEN SpA
*
*	This file is part of the CAEN SSDP Discover Tool.
*
*	The CAEN SSDP Discover Tool is free software; you can redistribute it and/or
*	modify it under the terms of the GNU Lesser General Public
*	License as published by the Free Software Foundation; either
*	version 3 of the License, or (at your option) any later version.
*
*	The CAEN SSDP Discover Tool is distributed in the hope that it will be useful,
*	but WITHOUT ANY WARRANTY; without even the implied warranty of
*	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
*	Lesser General Public License for more details.
*
*	You should have received a copy of the GNU Lesser General Public
*	License along with the CAEN SSDP Discover Tool; if not, see
*	https://www.gnu.org/licenses/.
*
*	SPDX-License-Identifier: LGPL-3.0-or-later
*
***************************************************************************//*!
*
*	\file		headers.hpp
*	\brief		SSDP header block parsing
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_HEADERS_HPP_
#define CAEN_SSDP_INCLUDE_HEADERS_HPP_

#include <map>
#include <string>
#include <string_view>

namespace caen {

namespace ssdp {

/**
 * Header name (upper case) to value (trimmed).
 */
using parsed_headers = std::map<std::string, std::string>;

namespace header {

static constexpr auto& location() noexcept { return "LOCATION"; }
static constexpr auto& server() noexcept { return "SERVER"; }
static constexpr auto& st() noexcept { return "ST"; }
static constexpr auto& usn() noexcept { return "USN"; }
static constexpr auto& cache_control() noexcept { return "CACHE-CONTROL"; }

} // namespace header

/**
 * Decode a datagram payload as UTF-8 text.
 *
 * Invalid byte sequences are dropped, the rest of the payload is kept.
 * @param payload	raw bytes
 * @return valid UTF-8 text
 */
std::string decode_payload(std::string_view payload);

/**
 * Parse an HTTP-like header block.
 *
 * Every line (terminated by CRLF, LF or CR) containing a colon is split on
 * the first colon: the key is trimmed and upper-cased, the value trimmed.
 * Lines without colon, like request and status lines, are ignored. When a
 * key appears more than once, the last value wins.
 * @param text		header block
 * @return parsed headers
 */
parsed_headers parse_headers(std::string_view text);

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_HEADERS_HPP_ */
