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
*	\file		query_transmitter.hpp
*	\brief		M-SEARCH transmission
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_QUERY_TRANSMITTER_HPP_
#define CAEN_SSDP_INCLUDE_QUERY_TRANSMITTER_HPP_

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/ip/udp.hpp>
#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "datagram_socket.hpp"
#include "discovery_request.hpp"

namespace caen {

namespace ssdp {

struct query_transmitter : private boost::noncopyable {

	/**
	 * Transmitter to the SSDP multicast group
	 * @param logger		logger
	 */
	explicit query_transmitter(std::shared_ptr<spdlog::logger> logger);

	/**
	 * Transmitter to a custom destination. The HOST header still names the
	 * SSDP multicast group.
	 * @param logger		logger
	 * @param destination	destination of the datagrams
	 */
	query_transmitter(std::shared_ptr<spdlog::logger> logger, boost::asio::ip::udp::endpoint destination);

	/**
	 * Open a socket and send the M-SEARCH message request.get_retries() times,
	 * with a fixed delay between consecutive sends.
	 * @param request		the request
	 * @return the socket, still open and not yet read from
	 * @throw ex::transmit_error if the socket cannot be opened or a send fails
	 */
	std::unique_ptr<datagram_socket> send(const discovery_request& request) const;

	/**
	 * @return the M-SEARCH message for the request
	 */
	static std::string format_request(const discovery_request& request);

	const boost::asio::ip::udp::endpoint& get_destination() const noexcept { return _destination; }

	static boost::asio::ip::udp::endpoint multicast_endpoint();

private:

	static constexpr auto& ssdp_request() noexcept {
		return "M-SEARCH * HTTP/1.1\r\nHOST: {}:{}\r\nMAN: \"ssdp:discover\"\r\nMX: {}\r\nST: {}\r\n\r\n";
	}

	std::shared_ptr<spdlog::logger> _logger;
	const boost::asio::ip::udp::endpoint _destination;
};

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_QUERY_TRANSMITTER_HPP_ */
