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
*	\file		lib_error.hpp
*	\brief		Exceptions
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_LIB_ERROR_HPP_
#define CAEN_SSDP_INCLUDE_LIB_ERROR_HPP_

#include <exception>
#include <stdexcept>
#include <string>

namespace caen {

namespace ssdp {

namespace ex {

using namespace std::string_literals;

struct runtime_error : public std::runtime_error {
	using std::runtime_error::runtime_error;
};

struct invalid_argument : public std::invalid_argument {
	using std::invalid_argument::invalid_argument;
};

/**
 * Raised when the search socket cannot be opened or the query cannot be sent.
 * This is the only error escaping a discovery session.
 */
struct transmit_error : public ex::runtime_error {
	using ex::runtime_error::runtime_error;
};

/**
 * Raised by a receive that waited the whole socket timeout without data.
 */
struct timeout : public ex::runtime_error {
	timeout() : runtime_error("timeout"s) {}
};

struct socket_error : public ex::runtime_error {
	using ex::runtime_error::runtime_error;
};

struct descriptor_fetch_error : public ex::runtime_error {
	using ex::runtime_error::runtime_error;
};

} // namespace ex

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_LIB_ERROR_HPP_ */
