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
*	\file		response_collector.hpp
*	\brief		SSDP response collection
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_RESPONSE_COLLECTOR_HPP_
#define CAEN_SSDP_INCLUDE_RESPONSE_COLLECTOR_HPP_

#include <chrono>
#include <memory>
#include <vector>

#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "datagram_socket.hpp"
#include "descriptor_fetcher.hpp"
#include "discovery_record.hpp"

namespace caen {

namespace ssdp {

struct collector_options {
	// if false, a receive timeout is ignored and the loop goes on until the deadline
	bool _stop_on_first_timeout{true};
};

/**
 * Drains the search socket for a fixed time window, turning every answer
 * with a LOCATION header into a discovery_record.
 */
struct response_collector : private boost::noncopyable {

	/**
	 * @param logger		logger
	 * @param fetcher		used to follow LOCATION urls, can be null if locations are never followed
	 * @param options		collection policy
	 */
	response_collector(std::shared_ptr<spdlog::logger> logger, std::shared_ptr<descriptor_fetcher> fetcher, collector_options options = {});

	/**
	 * Collect responses until max_wait has elapsed or, depending on the policy,
	 * until the first receive timeout. Socket errors and unexpected failures end
	 * the collection and the records collected so far are returned.
	 * @param socket				the search socket, closed before return
	 * @param max_wait				collection window
	 * @param follow_up_locations	if true, the document at each LOCATION is fetched
	 * @return records, in receipt order
	 * @throw ex::invalid_argument if socket is null, or if follow_up_locations is set without a fetcher
	 */
	std::vector<discovery_record> collect(std::unique_ptr<datagram_socket> socket, std::chrono::seconds max_wait, bool follow_up_locations) const;

private:

	discovery_record make_record(raw_datagram datagram, parsed_headers headers, bool follow_up_locations) const;

	std::shared_ptr<spdlog::logger> _logger;
	std::shared_ptr<descriptor_fetcher> _fetcher;
	const collector_options _options;
};

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_RESPONSE_COLLECTOR_HPP_ */
