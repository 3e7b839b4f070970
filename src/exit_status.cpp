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
*	\file		exit_status.cpp
*	\brief
*
******************************************************************************/

#include "exit_status.hpp"

#include <exception>
#include <utility>

#include <boost/program_options/errors.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "lib_error.hpp"

using namespace std::literals;

namespace caen {

namespace ssdp {

namespace exit_status {

namespace {

// spdlog never throws from log calls: errors are routed to its error handler
template <typename FuncT, typename TypeT>
void log(FuncT&& func, TypeT&& type, const std::exception& ex) noexcept {
	spdlog::error("[{}] {}: {}", std::forward<FuncT>(func), std::forward<TypeT>(type), ex.what());
}

} // unnamed namespace

int _handle_exception(std::string_view func) noexcept try {
	// this throw usage is allowed when an exception is presently being handled, it calls std::terminate if used otherwise
	throw;
}
catch (const ex::invalid_argument& ex) {
	// validation messages are meant for the user, no decoration
	spdlog::error("{}", ex.what());
	return failure;
}
catch (const boost::program_options::error& ex) {
	log(func, "invalid command line (see --help)"sv, ex);
	return failure;
}
catch (const ex::transmit_error& ex) {
	log(func, "failed to send SSDP discovery message"sv, ex);
	return failure;
}
catch (const ex::runtime_error& ex) {
	log(func, "generic runtime error"sv, ex);
	return failure;
}
catch (const std::exception& ex) {
	log(func, "generic error"sv, ex);
	return failure;
}
catch (...) {
	spdlog::error("[{}] unknown exception type", func);
	return failure;
}

} // namespace exit_status

} // namespace ssdp

} // namespace caen
