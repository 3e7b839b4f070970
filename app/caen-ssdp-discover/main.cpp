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
*	\file		main.cpp
*	\brief		SSDP discovery command line tool
*
******************************************************************************/

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/predef/os.h>
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#if BOOST_OS_WINDOWS
#include <io.h>
#else
#include <unistd.h>
#endif

#include "descriptor_fetcher.hpp"
#include "descriptor_info.hpp"
#include "discovery_record.hpp"
#include "discovery_request.hpp"
#include "exit_status.hpp"
#include "headers.hpp"
#include "library_logger.hpp"
#include "session.hpp"
#include "ssdp_definitions.hpp"

namespace po = boost::program_options;

using namespace std::literals;

namespace {

// only async-signal-safe calls allowed here
// stderr, as the logs: stdout carries only the results
extern "C" void interrupt_handler(int) {
	static constexpr char message[] = "\nInterrupted by user. Exiting...\n";
#if BOOST_OS_WINDOWS
	static_cast<void>(::_write(2, message, sizeof(message) - 1));
#else
	static_cast<void>(::write(STDERR_FILENO, message, sizeof(message) - 1));
#endif
	std::_Exit(caen::ssdp::exit_status::success);
}

po::options_description make_options() {
	po::options_description desc("SSDP device discovery\n\nUsage: caen-ssdp-discover [options]\n\nOptions");
	desc.add_options()
		("help,h", "print this help and exit")
		("search_target,s", po::value<std::string>()->default_value(caen::ssdp::defaults::search_target()), "search target (ST header)")
		("mx", po::value<int>()->default_value(caen::ssdp::defaults::mx), "maximum response delay requested to devices (MX header), in seconds")
		("max_wait,w", po::value<int>()->default_value(caen::ssdp::defaults::max_wait), "time to wait for responses, in seconds")
		("timeout,t", po::value<double>()->default_value(caen::ssdp::defaults::socket_timeout), "socket timeout, in seconds")
		("retries,r", po::value<int>()->default_value(caen::ssdp::defaults::retries), "number of discovery messages to send")
		("verbose,v", po::bool_switch(), "enable debug logging, including device descriptions")
		("no_fetch", po::bool_switch(), "do not retrieve the device description at LOCATION")
		("keep_listening", po::bool_switch(), "keep listening after a socket timeout, until max_wait")
		("json", po::bool_switch(), "print results as JSON array on stdout")
		;
	return desc;
}

std::string header_or_empty(const caen::ssdp::parsed_headers& headers, const std::string& key) {
	const auto it = headers.find(key);
	return (it != headers.end()) ? it->second : std::string{};
}

void print_records(const std::vector<caen::ssdp::discovery_record>& records) {
	namespace header = caen::ssdp::header;
	for (const auto& record : records) {
		std::cout << fmt::format("IP: {}, Port: {}\n", record.get_ip_address(), record.get_port());
		std::cout << fmt::format("Location: {}\n", record.get_location().value_or(std::string{}));
		std::cout << fmt::format("Server: {}\n", header_or_empty(record.get_headers(), header::server()));
		std::cout << fmt::format("ST: {}\n", header_or_empty(record.get_headers(), header::st()));
		std::cout << fmt::format("USN: {}\n", header_or_empty(record.get_headers(), header::usn()));
		if (record.has_descriptor()) {
			const auto info = caen::ssdp::parse_descriptor_info(*record.get_descriptor());
			if (info) {
				std::cout << fmt::format("Device: {} ({} {})\n", info->_friendly_name, info->_manufacturer, info->_model_name);
				if (!info->_serial_number.empty())
					std::cout << fmt::format("Serial number: {}\n", info->_serial_number);
				if (!info->_udn.empty())
					std::cout << fmt::format("UDN: {}\n", info->_udn);
			}
		} else if (record.get_descriptor()) {
			std::cout << fmt::format("Device description: {}\n", *record.get_descriptor());
		}
		std::cout << std::string(20, '-') << std::endl;
	}
}

} // unnamed namespace

int main(int argc, char* argv[]) try {

	std::signal(SIGINT, interrupt_handler);

	const auto desc = make_options();

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, desc), vm);
	po::notify(vm);

	if (vm.count("help")) {
		std::cout << desc << std::endl;
		return caen::ssdp::exit_status::success;
	}

	const auto verbose = vm["verbose"].as<bool>();
	caen::ssdp::library_logger::init(verbose ? spdlog::level::debug : spdlog::level::info);

	const caen::ssdp::discovery_request request(
		vm["search_target"].as<std::string>(),
		vm["mx"].as<int>(),
		vm["max_wait"].as<int>(),
		vm["retries"].as<int>(),
		vm["timeout"].as<double>()
	);

	const auto follow_up = !vm["no_fetch"].as<bool>();

	caen::ssdp::session_options options;
	options._collector._stop_on_first_timeout = !vm["keep_listening"].as<bool>();

	auto fetcher = std::make_shared<caen::ssdp::http_descriptor_fetcher>(caen::ssdp::library_logger::create_logger("http"s));
	const caen::ssdp::session discovery(caen::ssdp::library_logger::create_logger("ssdp"s), std::move(fetcher), options);

	const auto records = discovery.run(request, follow_up);

	if (records.empty())
		spdlog::info("No SSDP devices found.");
	else
		spdlog::info("Found {} SSDP devices.", records.size());

	if (vm["json"].as<bool>())
		std::cout << nlohmann::json(records).dump(4) << std::endl;
	else
		print_records(records);

	return caen::ssdp::exit_status::success;
}
catch (...) {
	return handle_exception();
}
