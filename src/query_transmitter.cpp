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
*	\file		query_transmitter.cpp
*	\brief
*
******************************************************************************/

#include "query_transmitter.hpp"

#include <thread>
#include <utility>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/system/system_error.hpp>
#include <spdlog/fmt/fmt.h>

#include "lib_error.hpp"
#include "ssdp_definitions.hpp"
#include "udp_socket.hpp"

namespace caen {

namespace ssdp {

query_transmitter::query_transmitter(std::shared_ptr<spdlog::logger> logger)
: query_transmitter(std::move(logger), multicast_endpoint()) {
}

query_transmitter::query_transmitter(std::shared_ptr<spdlog::logger> logger, boost::asio::ip::udp::endpoint destination)
: _logger{std::move(logger)}
, _destination(std::move(destination)) {
}

std::string query_transmitter::format_request(const discovery_request& request) {
	return fmt::format(ssdp_request(), multicast::address(), multicast::port, request.get_mx(), request.get_search_target());
}

boost::asio::ip::udp::endpoint query_transmitter::multicast_endpoint() {
	return { boost::asio::ip::make_address_v4(multicast::address()), multicast::port };
}

std::unique_ptr<datagram_socket> query_transmitter::send(const discovery_request& request) const try {

	const auto message = format_request(request);

	auto socket = std::make_unique<udp_socket>(_logger, request.socket_timeout_duration());

	const auto retries = request.get_retries();
	for (int i = 0; i < retries; ++i) {
		if (i != 0)
			std::this_thread::sleep_for(defaults::inter_send_delay);
		socket->send_to(message, _destination);
		_logger->debug("SSDP discovery message sent (attempt {}/{}).", i + 1, retries);
	}

	return socket;
}
catch (const ex::socket_error& e) {
	// socket, if created, has already been closed by its destructor
	_logger->error("Socket error while sending SSDP discovery: {}", e.what());
	throw ex::transmit_error(e.what());
}
catch (const boost::system::system_error& e) {
	_logger->error("Socket error while sending SSDP discovery: {}", e.what());
	throw ex::transmit_error(e.what());
}

} // namespace ssdp

} // namespace caen
