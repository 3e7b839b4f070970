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
*	\file		response_collector.cpp
*	\brief
*
******************************************************************************/

#include "response_collector.hpp"

#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "cpp-utility/scope_exit.hpp"
#include "headers.hpp"
#include "lib_error.hpp"

using namespace std::literals;

namespace caen {

namespace ssdp {

response_collector::response_collector(std::shared_ptr<spdlog::logger> logger, std::shared_ptr<descriptor_fetcher> fetcher, collector_options options)
: _logger{std::move(logger)}
, _fetcher{std::move(fetcher)}
, _options(options) {
}

std::vector<discovery_record> response_collector::collect(std::unique_ptr<datagram_socket> socket, std::chrono::seconds max_wait, bool follow_up_locations) const {

	if (!socket)
		throw ex::invalid_argument("null socket"s);

	// close on every exit path, including the argument checks below
	auto close_socket = make_scope_exit([&socket]() noexcept { socket->close(); });

	if (follow_up_locations && !_fetcher)
		throw ex::invalid_argument("descriptor fetcher required to follow locations"s);

	std::vector<discovery_record> records;

	const auto deadline = std::chrono::steady_clock::now() + max_wait;

	try {

		while (std::chrono::steady_clock::now() < deadline) {

			raw_datagram datagram;

			try {
				datagram = socket->receive();
			}
			catch (const ex::timeout&) {
				if (_options._stop_on_first_timeout) {
					_logger->debug("Socket timeout, stopping to listen for responses.");
					break;
				}
				SPDLOG_LOGGER_TRACE(_logger, "socket timeout, listening again");
				continue;
			}
			catch (const ex::socket_error& e) {
				_logger->error("Socket error while receiving SSDP response: {}", e.what());
				break;
			}

			auto headers = parse_headers(decode_payload(datagram._payload));

			if (headers.find(header::location()) == headers.end()) {
				_logger->debug("Response from {}:{} without LOCATION header ignored.", datagram._source_address, datagram._source_port);
				continue;
			}

			records.emplace_back(make_record(std::move(datagram), std::move(headers), follow_up_locations));
		}

	}
	catch (const std::exception& e) {
		// the records collected so far are still valid
		_logger->error("Unexpected error while collecting SSDP responses: {}", e.what());
	}

	return records;
}

discovery_record response_collector::make_record(raw_datagram datagram, parsed_headers headers, bool follow_up_locations) const {

	auto location = headers.at(header::location());

	std::optional<std::string> descriptor;

	if (follow_up_locations) {
		try {
			descriptor = _fetcher->fetch(location);
			_logger->debug("Device Description from {}:\n{}", location, *descriptor);
		}
		catch (const std::exception& e) {
			_logger->warn("Failed to retrieve device description from {}: {}", location, e.what());
			descriptor = discovery_record::unavailable_descriptor();
		}
	}

	_logger->info("Found device at {}:{} - Location: {}", datagram._source_address, datagram._source_port, location);

	return discovery_record(std::move(datagram._source_address), datagram._source_port, std::move(headers), std::move(location), std::move(descriptor));
}

} // namespace ssdp

} // namespace caen
