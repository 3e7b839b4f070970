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
*	\file		test_discovery_session.cpp
*	\brief
*
******************************************************************************/

#include <catch2/catch.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include <boost/asio/ip/address_v6.hpp>
#include <nlohmann/json.hpp>

#include "descriptor_info.hpp"
#include "discovery_request.hpp"
#include "lib_error.hpp"
#include "query_transmitter.hpp"
#include "session.hpp"
#include "support/test_support.hpp"

using namespace caen::ssdp;
using namespace caen::ssdp::test;
using namespace std::literals;

namespace {

constexpr auto& device_response() {
	return
		"HTTP/1.1 200 OK\r\n"
		"CACHE-CONTROL: max-age=1800\r\n"
		"EXT:\r\n"
		"LOCATION: http://10.0.0.5:80/desc.xml\r\n"
		"SERVER: Linux/5.10 UPnP/1.0 caen/1.0\r\n"
		"ST: upnp:rootdevice\r\n"
		"USN: uuid:0dd6a2b0-0000-1000-8000-000000003039::upnp:rootdevice\r\n"
		"\r\n";
}

session_options loopback_options(const mock_ssdp_responder& responder) {
	session_options options;
	options._destination = responder.get_endpoint();
	return options;
}

} // unnamed namespace

TEST_CASE("session: single device answering once", "[integration][session]") {
	mock_ssdp_responder responder(device_response());
	const session discovery(null_logger(), nullptr, loopback_options(responder));
	const discovery_request request("upnp:rootdevice", 2, 2, 3, 5.0);

	const auto records = discovery.run(request, false);

	REQUIRE(records.size() == 1);
	const auto& record = records.front();
	REQUIRE(record.get_ip_address() == "127.0.0.1");
	REQUIRE(record.get_port() == responder.get_endpoint().port());
	REQUIRE(record.get_location() == "http://10.0.0.5:80/desc.xml");
	REQUIRE(record.get_headers().at("ST") == "upnp:rootdevice");
	REQUIRE(record.get_headers().at("EXT").empty());
	REQUIRE_FALSE(record.get_descriptor());

	REQUIRE(responder.get_query_count() == 3);
	REQUIRE(responder.get_first_query() == query_transmitter::format_request(request));
}

TEST_CASE("session: follow-up fetch of the device description", "[integration][session]") {
	mock_ssdp_responder responder(device_response());
	auto fetcher = std::make_shared<scripted_fetcher>(std::map<std::string, std::string>{
		{ "http://10.0.0.5:80/desc.xml", "<root><device><friendlyName>VX2740</friendlyName><modelName>VX2740</modelName></device></root>" },
	});
	const session discovery(null_logger(), fetcher, loopback_options(responder));

	const auto records = discovery.run(discovery_request("upnp:rootdevice", 1, 1, 1, 0.5), true);

	REQUIRE(records.size() == 1);
	REQUIRE(records.front().has_descriptor());
	const auto info = parse_descriptor_info(*records.front().get_descriptor());
	REQUIRE(info);
	REQUIRE(info->_friendly_name == "VX2740");
	REQUIRE(fetcher->get_requests().size() == 1);
}

TEST_CASE("session: unreachable description is marked unavailable", "[integration][session]") {
	mock_ssdp_responder responder(device_response());
	auto fetcher = std::make_shared<scripted_fetcher>(std::map<std::string, std::string>{});
	const session discovery(null_logger(), fetcher, loopback_options(responder));

	const auto records = discovery.run(discovery_request("upnp:rootdevice", 1, 1, 1, 0.5), true);

	REQUIRE(records.size() == 1);
	REQUIRE(records.front().get_descriptor() == "Unavailable");

	const nlohmann::json j = records;
	REQUIRE(j.size() == 1);
	REQUIRE(j.at(0).at("device_description") == "Unavailable");
}

TEST_CASE("session: no answer is an empty result", "[integration][session]") {
	loopback_udp_receiver silent_device;
	session_options options;
	options._destination = silent_device.get_endpoint();
	const session discovery(null_logger(), nullptr, options);

	REQUIRE(discovery.run(discovery_request("upnp:rootdevice", 1, 1, 1, 0.3), false).empty());
	REQUIRE(silent_device.receive(2, 300ms).size() == 1);
}

TEST_CASE("session: transmit failure escapes", "[integration][session]") {
	session_options options;
	options._destination = { boost::asio::ip::address_v6::loopback(), 1900 };
	const session discovery(null_logger(), nullptr, options);

	REQUIRE_THROWS_AS(discovery.run(discovery_request(), false), ex::transmit_error);
}
