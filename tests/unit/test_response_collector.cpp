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
*	\file		test_response_collector.cpp
*	\brief
*
******************************************************************************/

#include <catch2/catch.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "lib_error.hpp"
#include "response_collector.hpp"
#include "support/test_support.hpp"

using namespace caen::ssdp;
using namespace caen::ssdp::test;
using namespace std::literals;

namespace {

std::string response(const std::string& location) {
	return "HTTP/1.1 200 OK\r\nCACHE-CONTROL: max-age=1800\r\nLOCATION: " + location + "\r\nST: upnp:rootdevice\r\n\r\n";
}

constexpr auto& no_location_response() {
	return "HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\nUSN: uuid:1234\r\n\r\n";
}

} // unnamed namespace

TEST_CASE("response_collector: only responses with LOCATION produce records", "[collector]") {
	auto socket = std::make_unique<scripted_socket>(std::vector<scripted_socket::step>{
		scripted_socket::datagram(response("http://192.168.1.10:80/desc.xml"), "192.168.1.10", 1900),
		scripted_socket::datagram(no_location_response(), "192.168.1.11", 1900),
		scripted_socket::datagram(response("http://192.168.1.12:5000/rootDesc.xml"), "192.168.1.12", 50000),
	});
	const auto close_count = socket->close_count();

	const response_collector collector(null_logger(), nullptr);
	const auto records = collector.collect(std::move(socket), 2s, false);

	REQUIRE(records.size() == 2);
	REQUIRE(records[0].get_ip_address() == "192.168.1.10");
	REQUIRE(records[0].get_port() == 1900);
	REQUIRE(records[0].get_location() == "http://192.168.1.10:80/desc.xml");
	REQUIRE(records[0].get_headers().at("CACHE-CONTROL") == "max-age=1800");
	REQUIRE_FALSE(records[0].get_descriptor());
	REQUIRE(records[1].get_ip_address() == "192.168.1.12");
	REQUIRE(records[1].get_port() == 50000);
	REQUIRE(records[1].get_location() == "http://192.168.1.12:5000/rootDesc.xml");
	REQUIRE(*close_count == 1);
}

TEST_CASE("response_collector: follow-up fetch per record", "[collector]") {
	auto socket = std::make_unique<scripted_socket>(std::vector<scripted_socket::step>{
		scripted_socket::datagram(response("http://192.168.1.10/ok.xml"), "192.168.1.10"),
		scripted_socket::datagram(response("http://192.168.1.11/missing.xml"), "192.168.1.11"),
		scripted_socket::datagram(response("http://192.168.1.12/ok.xml"), "192.168.1.12"),
	});
	auto fetcher = std::make_shared<scripted_fetcher>(std::map<std::string, std::string>{
		{ "http://192.168.1.10/ok.xml", "<root>10</root>" },
		{ "http://192.168.1.12/ok.xml", "<root>12</root>" },
	});

	const response_collector collector(null_logger(), fetcher);
	const auto records = collector.collect(std::move(socket), 2s, true);

	// a failed fetch never discards the record
	REQUIRE(records.size() == 3);
	REQUIRE(records[0].get_descriptor() == "<root>10</root>");
	REQUIRE(records[1].get_descriptor() == "Unavailable");
	REQUIRE_FALSE(records[1].has_descriptor());
	REQUIRE(records[2].get_descriptor() == "<root>12</root>");

	// exactly one attempt per record, in receipt order
	REQUIRE(fetcher->get_requests() == std::vector<std::string>{ "http://192.168.1.10/ok.xml", "http://192.168.1.11/missing.xml", "http://192.168.1.12/ok.xml" });
}

TEST_CASE("response_collector: no fetch without follow-up", "[collector]") {
	auto socket = std::make_unique<scripted_socket>(std::vector<scripted_socket::step>{
		scripted_socket::datagram(response("http://192.168.1.10/ok.xml")),
	});
	auto fetcher = std::make_shared<scripted_fetcher>(std::map<std::string, std::string>{});

	const response_collector collector(null_logger(), fetcher);
	const auto records = collector.collect(std::move(socket), 2s, false);

	REQUIRE(records.size() == 1);
	REQUIRE(fetcher->get_requests().empty());
}

TEST_CASE("response_collector: first timeout stops the collection by default", "[collector]") {
	auto socket = std::make_unique<scripted_socket>(std::vector<scripted_socket::step>{
		scripted_socket::datagram(response("http://192.168.1.10/a.xml")),
		scripted_socket::timeout(),
		scripted_socket::datagram(response("http://192.168.1.11/b.xml")),
	});
	const auto receive_count = socket->receive_count();
	const auto close_count = socket->close_count();

	const response_collector collector(null_logger(), nullptr);
	const auto records = collector.collect(std::move(socket), 2s, false);

	REQUIRE(records.size() == 1);
	REQUIRE(*receive_count == 2);
	REQUIRE(*close_count == 1);
}

TEST_CASE("response_collector: timeouts ignored until the deadline when configured", "[collector]") {
	auto socket = std::make_unique<scripted_socket>(std::vector<scripted_socket::step>{
		scripted_socket::timeout(),
		scripted_socket::datagram(response("http://192.168.1.10/a.xml")),
		scripted_socket::timeout(),
		scripted_socket::datagram(response("http://192.168.1.11/b.xml")),
	});

	collector_options options;
	options._stop_on_first_timeout = false;

	const response_collector collector(null_logger(), nullptr, options);

	const auto begin = std::chrono::steady_clock::now();
	const auto records = collector.collect(std::move(socket), 1s, false);
	const auto elapsed = std::chrono::steady_clock::now() - begin;

	REQUIRE(records.size() == 2);
	REQUIRE(records[0].get_location() == "http://192.168.1.10/a.xml");
	REQUIRE(records[1].get_location() == "http://192.168.1.11/b.xml");
	REQUIRE(elapsed >= 1s);
}

TEST_CASE("response_collector: collection ends at the deadline", "[collector]") {
	std::vector<scripted_socket::step> steps;
	for (int i = 0; i < 100; ++i)
		steps.emplace_back(scripted_socket::datagram(response("http://192.168.1.10/a.xml"), "192.168.1.10", 1900, 100ms));
	auto socket = std::make_unique<scripted_socket>(std::move(steps));

	const response_collector collector(null_logger(), nullptr);

	const auto begin = std::chrono::steady_clock::now();
	const auto records = collector.collect(std::move(socket), 1s, false);
	const auto elapsed = std::chrono::steady_clock::now() - begin;

	REQUIRE(records.size() >= 5);
	REQUIRE(records.size() <= 11);
	REQUIRE(elapsed < 3s);
}

TEST_CASE("response_collector: socket error returns partial results", "[collector]") {
	auto socket = std::make_unique<scripted_socket>(std::vector<scripted_socket::step>{
		scripted_socket::datagram(response("http://192.168.1.10/a.xml")),
		scripted_socket::socket_error(),
		scripted_socket::datagram(response("http://192.168.1.11/b.xml")),
	});
	const auto close_count = socket->close_count();

	const response_collector collector(null_logger(), nullptr);

	std::vector<discovery_record> records;
	REQUIRE_NOTHROW(records = collector.collect(std::move(socket), 2s, false));
	REQUIRE(records.size() == 1);
	REQUIRE(*close_count == 1);
}

TEST_CASE("response_collector: unexpected failure returns partial results", "[collector]") {
	auto socket = std::make_unique<scripted_socket>(std::vector<scripted_socket::step>{
		scripted_socket::datagram(response("http://192.168.1.10/a.xml")),
		scripted_socket::datagram(response("http://192.168.1.11/b.xml")),
		scripted_socket::unexpected(),
		scripted_socket::datagram(response("http://192.168.1.12/c.xml")),
	});
	const auto close_count = socket->close_count();

	const response_collector collector(null_logger(), nullptr);

	std::vector<discovery_record> records;
	REQUIRE_NOTHROW(records = collector.collect(std::move(socket), 2s, false));
	REQUIRE(records.size() == 2);
	REQUIRE(*close_count == 1);
}

TEST_CASE("response_collector: no responses is not an error", "[collector]") {
	auto socket = std::make_unique<scripted_socket>(std::vector<scripted_socket::step>{});
	const auto close_count = socket->close_count();

	const response_collector collector(null_logger(), nullptr);

	REQUIRE(collector.collect(std::move(socket), 1s, false).empty());
	REQUIRE(*close_count == 1);
}

TEST_CASE("response_collector: invalid arguments", "[collector]") {
	const response_collector collector(null_logger(), nullptr);

	REQUIRE_THROWS_AS(collector.collect(nullptr, 1s, false), ex::invalid_argument);

	auto socket = std::make_unique<scripted_socket>(std::vector<scripted_socket::step>{});
	const auto close_count = socket->close_count();
	REQUIRE_THROWS_AS(collector.collect(std::move(socket), 1s, true), ex::invalid_argument);
	REQUIRE(*close_count == 1);
}
