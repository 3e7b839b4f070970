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
*	\file		exit_status.hpp
*	\brief		Exception to exit status mapping
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_EXIT_STATUS_HPP_
#define CAEN_SSDP_INCLUDE_EXIT_STATUS_HPP_

#include <cstdlib>
#include <string_view>

#include <boost/current_function.hpp>

namespace caen {

namespace ssdp {

namespace exit_status {

static constexpr int success{EXIT_SUCCESS};
static constexpr int failure{EXIT_FAILURE};

/**
 * Map the exception currently being handled to a process exit status, logging it on the default logger.
 * @warning must be called only inside a catch block
 * @param func		name of the function that caught the exception
 * @return the exit status
 */
int _handle_exception(std::string_view func) noexcept;

} // namespace exit_status

} // namespace ssdp

} // namespace caen

// macro to automatic put function name
#define handle_exception() ::caen::ssdp::exit_status::_handle_exception(BOOST_CURRENT_FUNCTION)

#endif /* CAEN_SSDP_INCLUDE_EXIT_STATUS_HPP_ */
