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
*	\file		discovery_request.hpp
*	\brief		M-SEARCH parameters
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_DISCOVERY_REQUEST_HPP_
#define CAEN_SSDP_INCLUDE_DISCOVERY_REQUEST_HPP_

#include <chrono>
#include <string>

#include "ssdp_definitions.hpp"

namespace caen {

namespace ssdp {

/**
 * Parameters of a single M-SEARCH session.
 *
 * Validated on construction and immutable afterwards: an instance always
 * holds positive numeric fields and a search target that fits in a single
 * header line.
 */
struct discovery_request {

	/**
	 * @param search_target		value of the ST header
	 * @param mx				value of the MX header, in seconds
	 * @param max_wait			collection window, in seconds
	 * @param retries			number of M-SEARCH datagrams to send
	 * @param socket_timeout	timeout of a single receive, in seconds
	 * @throw ex::invalid_argument if any field is invalid
	 */
	discovery_request(std::string search_target, int mx, int max_wait, int retries, double socket_timeout);

	/**
	 * Request with default values and custom search target
	 */
	explicit discovery_request(std::string search_target = defaults::search_target());

	discovery_request(const discovery_request&) = default;
	discovery_request(discovery_request&&) = default;
	~discovery_request() = default;

	discovery_request& operator=(const discovery_request&) = delete;
	discovery_request& operator=(discovery_request&&) = delete;

	const std::string& get_search_target() const noexcept { return _search_target; }
	int get_mx() const noexcept { return _mx; }
	int get_max_wait() const noexcept { return _max_wait; }
	int get_retries() const noexcept { return _retries; }
	double get_socket_timeout() const noexcept { return _socket_timeout; }

	std::chrono::seconds max_wait_duration() const noexcept;
	std::chrono::milliseconds socket_timeout_duration() const noexcept;

private:
	const std::string _search_target;
	const int _mx;
	const int _max_wait;
	const int _retries;
	const double _socket_timeout;
};

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_DISCOVERY_REQUEST_HPP_ */
