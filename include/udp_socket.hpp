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
*	\file		udp_socket.hpp
*	\brief		UDP socket with receive timeout
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_UDP_SOCKET_HPP_
#define CAEN_SSDP_INCLUDE_UDP_SOCKET_HPP_

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/ip/udp.hpp>
#include <spdlog/spdlog.h>

#include "datagram_socket.hpp"

namespace caen {

namespace ssdp {

/**
 * IPv4 UDP socket bound on an ephemeral port, with a timeout on receive.
 *
 * Boost.ASIO does not support timeouts on synchronous operations, so every
 * receive is an asynchronous operation run on a private io_context for the
 * socket timeout.
 */
struct udp_socket : public datagram_socket {

	/**
	 * Open and bind the socket.
	 * @param logger			logger
	 * @param receive_timeout	timeout of a single receive
	 * @throw ex::socket_error on failure
	 */
	udp_socket(std::shared_ptr<spdlog::logger> logger, std::chrono::milliseconds receive_timeout);
	~udp_socket();

	/**
	 * @throw ex::socket_error on failure
	 */
	void send_to(const std::string& payload, const boost::asio::ip::udp::endpoint& destination);

	raw_datagram receive() override;
	void close() noexcept override;
	bool is_open() const noexcept override;

private:

	struct socket_impl; // forward declaration
	std::unique_ptr<socket_impl> _pimpl;

};

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_UDP_SOCKET_HPP_ */
