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
*	\file		headers.cpp
*	\brief
*
******************************************************************************/

#include "headers.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace caen {

namespace ssdp {

namespace {

struct utf8_sequence {
	std::size_t length;
	std::uint8_t second_min;
	std::uint8_t second_max;
};

// Table 3-7 of The Unicode Standard: well-formed UTF-8 byte sequences
utf8_sequence classify_lead(std::uint8_t lead) noexcept {
	if (lead < 0x80)
		return { 1, 0x00, 0x00 };
	if (lead >= 0xc2 && lead <= 0xdf)
		return { 2, 0x80, 0xbf };
	if (lead == 0xe0)
		return { 3, 0xa0, 0xbf };
	if (lead == 0xed)
		return { 3, 0x80, 0x9f };
	if (lead >= 0xe1 && lead <= 0xef)
		return { 3, 0x80, 0xbf };
	if (lead == 0xf0)
		return { 4, 0x90, 0xbf };
	if (lead >= 0xf1 && lead <= 0xf3)
		return { 4, 0x80, 0xbf };
	if (lead == 0xf4)
		return { 4, 0x80, 0x8f };
	return { 0, 0x00, 0x00 };
}

bool is_continuation(std::uint8_t c) noexcept {
	return (c & 0xc0) == 0x80;
}

/*
 * Returns the number of bytes of the well-formed sequence starting at pos,
 * or zero if the sequence is ill-formed. In the latter case, skip is set to
 * the size of the maximal invalid subpart, that is always dropped as a whole.
 */
std::size_t well_formed_length(std::string_view s, std::size_t pos, std::size_t& skip) noexcept {
	const auto lead = static_cast<std::uint8_t>(s[pos]);
	const auto seq = classify_lead(lead);
	skip = 1;
	if (seq.length == 0)
		return 0;
	for (std::size_t i = 1; i < seq.length; ++i) {
		if (pos + i >= s.size())
			return 0;
		const auto c = static_cast<std::uint8_t>(s[pos + i]);
		const bool valid = (i == 1) ? (c >= seq.second_min && c <= seq.second_max) : is_continuation(c);
		if (!valid)
			return 0;
		skip = i + 1;
	}
	return seq.length;
}

template <typename Callable>
void for_each_line(std::string_view text, Callable f) {
	std::size_t begin{0};
	while (begin < text.size()) {
		const auto end = text.find_first_of("\r\n", begin);
		if (end == std::string_view::npos) {
			f(text.substr(begin));
			return;
		}
		f(text.substr(begin, end - begin));
		begin = end + 1;
		// CRLF is a single terminator
		if (text[end] == '\r' && begin < text.size() && text[begin] == '\n')
			++begin;
	}
}

} // unnamed namespace

std::string decode_payload(std::string_view payload) {
	std::string res;
	res.reserve(payload.size());
	std::size_t pos{0};
	while (pos < payload.size()) {
		std::size_t skip;
		const auto length = well_formed_length(payload, pos, skip);
		if (length != 0) {
			res.append(payload.data() + pos, length);
			pos += length;
		} else {
			pos += skip;
		}
	}
	return res;
}

parsed_headers parse_headers(std::string_view text) {
	parsed_headers res;
	for_each_line(text, [&res](std::string_view line) {
		const auto sep = line.find(':');
		if (sep == std::string_view::npos)
			return;
		auto key = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(std::string(line.substr(0, sep))));
		auto value = boost::algorithm::trim_copy(std::string(line.substr(sep + 1)));
		// last value wins on duplicated keys
		res[std::move(key)] = std::move(value);
	});
	return res;
}

} // namespace ssdp

} // namespace caen
