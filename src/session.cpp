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
*	\file		session.cpp
*	\brief
*
******************************************************************************/

#include "session.hpp"

#include <utility>

namespace caen {

namespace ssdp {

session::session(std::shared_ptr<spdlog::logger> logger, std::shared_ptr<descriptor_fetcher> fetcher, session_options options)
: _logger{std::move(logger)}
, _transmitter(_logger->clone(_logger->name() + ".transmitter"), options._destination)
, _collector(_logger->clone(_logger->name() + ".collector"), std::move(fetcher), options._collector) {
}

std::vector<discovery_record> session::run(const discovery_request& request, bool follow_up_locations) const {

	SPDLOG_LOGGER_DEBUG(_logger, "search target={} mx={} max_wait={} retries={} timeout={}", request.get_search_target(), request.get_mx(), request.get_max_wait(), request.get_retries(), request.get_socket_timeout());

	auto socket = _transmitter.send(request);

	return _collector.collect(std::move(socket), request.max_wait_duration(), follow_up_locations);
}

} // namespace ssdp

} // namespace caen
