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
*	\file		datagram_socket.hpp
*	\brief		Receiving side of the search socket
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_DATAGRAM_SOCKET_HPP_
#define CAEN_SSDP_INCLUDE_DATAGRAM_SOCKET_HPP_

#include <cstdint>
#include <string>
#include <type_traits>

#include <boost/core/noncopyable.hpp>
#include <boost/static_assert.hpp>

namespace caen {

namespace ssdp {

struct raw_datagram {
	std::string _source_address;
	std::uint16_t _source_port;
	std::string _payload;
};

/**
 * Receiving side of the search socket, as seen by the response collector.
 */
struct datagram_socket : private boost::noncopyable {

	virtual ~datagram_socket() = default;

	/**
	 * Wait for a single datagram, at most for the socket timeout.
	 * @return the datagram
	 * @throw ex::timeout if no datagram arrived within the socket timeout
	 * @throw ex::socket_error on any other failure
	 */
	virtual raw_datagram receive() = 0;

	/**
	 * Release the socket. Subsequent calls have no effect.
	 */
	virtual void close() noexcept = 0;

	virtual bool is_open() const noexcept = 0;

};

BOOST_STATIC_ASSERT(std::is_abstract<datagram_socket>::value);
BOOST_STATIC_ASSERT(std::has_virtual_destructor<datagram_socket>::value);

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_DATAGRAM_SOCKET_HPP_ */
