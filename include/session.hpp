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
*	\file		session.hpp
*	\brief		Discovery session
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_SESSION_HPP_
#define CAEN_SSDP_INCLUDE_SESSION_HPP_

#include <memory>
#include <vector>

#include <boost/asio/ip/udp.hpp>
#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "descriptor_fetcher.hpp"
#include "discovery_record.hpp"
#include "discovery_request.hpp"
#include "query_transmitter.hpp"
#include "response_collector.hpp"

namespace caen {

namespace ssdp {

struct session_options {
	boost::asio::ip::udp::endpoint _destination{query_transmitter::multicast_endpoint()};
	collector_options _collector{};
};

/**
 * A discovery round: M-SEARCH transmission followed by response collection.
 */
struct session : private boost::noncopyable {

	/**
	 * @param logger	parent logger, cloned for transmitter and collector
	 * @param fetcher	used to follow LOCATION urls, can be null if locations are never followed
	 * @param options	options
	 */
	session(std::shared_ptr<spdlog::logger> logger, std::shared_ptr<descriptor_fetcher> fetcher, session_options options = {});

	/**
	 * @param request				the request
	 * @param follow_up_locations	if true, the document at each LOCATION is fetched
	 * @return the discovered devices, in receipt order
	 * @throw ex::transmit_error if the query cannot be sent
	 */
	std::vector<discovery_record> run(const discovery_request& request, bool follow_up_locations) const;

private:
	std::shared_ptr<spdlog::logger> _logger;
	query_transmitter _transmitter;
	response_collector _collector;
};

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_SESSION_HPP_ */
