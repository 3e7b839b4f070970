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
*	\file		ssdp_definitions.hpp
*	\brief		Definitions
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_SSDP_DEFINITIONS_HPP_
#define CAEN_SSDP_INCLUDE_SSDP_DEFINITIONS_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>

#define CAEN_SSDP_VERSION_MAJOR		1
#define CAEN_SSDP_VERSION_MINOR		0
#define CAEN_SSDP_VERSION_PATCH		0
#define CAEN_SSDP_VERSION_STRING	"1.0.0"

namespace caen {

namespace ssdp {

namespace multicast {

// UPnP Device Architecture 2.0, section 1.1.2
static constexpr auto& address() noexcept { return "239.255.255.250"; }
static constexpr std::uint16_t port{1900};
static constexpr int hops{4};

} // namespace multicast

namespace defaults {

static constexpr auto& search_target() noexcept { return "upnp:rootdevice"; }
static constexpr int mx{2};
static constexpr int max_wait{2};
static constexpr int retries{3};
static constexpr double socket_timeout{5.0};
// one day, far below the range of the nanosecond clocks used by Boost.ASIO timers
static constexpr double max_socket_timeout{86400.0};

static constexpr std::chrono::milliseconds inter_send_delay{100};
static constexpr std::chrono::milliseconds descriptor_timeout{5000};
static constexpr int max_redirects{5};

} // namespace defaults

namespace max_size {

// largest UDP payload on IPv4
static constexpr std::size_t datagram{65507};

// HTTP response to a descriptor request, headers included
static constexpr std::size_t http_response{1024 * 1024};

} // namespace max_size

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_SSDP_DEFINITIONS_HPP_ */
