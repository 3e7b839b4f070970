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
*	\file		discovery_request.cpp
*	\brief
*
******************************************************************************/

#include "discovery_request.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "lib_error.hpp"

using namespace std::literals;

namespace caen {

namespace ssdp {

namespace {

void validate(const std::string& search_target, int mx, int max_wait, int retries, double socket_timeout) {
	if (max_wait <= 0)
		throw ex::invalid_argument("Max wait time must be a positive integer."s);
	// NaN fails this check too
	if (!(socket_timeout > 0.) || !std::isfinite(socket_timeout))
		throw ex::invalid_argument("Timeout must be a positive number."s);
	if (socket_timeout > defaults::max_socket_timeout)
		throw ex::invalid_argument(fmt::format("Timeout must not exceed {} seconds.", defaults::max_socket_timeout));
	if (retries <= 0)
		throw ex::invalid_argument("Number of retries must be a positive integer."s);
	if (mx <= 0)
		throw ex::invalid_argument("MX must be a positive integer."s);
	if (search_target.empty())
		throw ex::invalid_argument("Search target must not be empty."s);
	if (search_target.find_first_of("\r\n"sv) != std::string::npos)
		throw ex::invalid_argument("Search target must not contain line breaks."s);
}

} // unnamed namespace

discovery_request::discovery_request(std::string search_target, int mx, int max_wait, int retries, double socket_timeout)
: _search_target((validate(search_target, mx, max_wait, retries, socket_timeout), std::move(search_target)))
, _mx{mx}
, _max_wait{max_wait}
, _retries{retries}
, _socket_timeout{socket_timeout} {
}

discovery_request::discovery_request(std::string search_target)
: discovery_request(std::move(search_target), defaults::mx, defaults::max_wait, defaults::retries, defaults::socket_timeout) {
}

std::chrono::seconds discovery_request::max_wait_duration() const noexcept {
	return std::chrono::seconds{_max_wait};
}

std::chrono::milliseconds discovery_request::socket_timeout_duration() const noexcept {
	const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>{_socket_timeout});
	// sub-millisecond timeouts are rounded up to 1 ms
	return std::max(timeout, std::chrono::milliseconds{1});
}

} // namespace ssdp

} // namespace caen
