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
*	\file		test_query_transmitter.cpp
*	\brief
*
******************************************************************************/

#include <catch2/catch.hpp>

#include <chrono>
#include <string>

#include <boost/asio/ip/address_v6.hpp>

#include "discovery_request.hpp"
#include "lib_error.hpp"
#include "query_transmitter.hpp"
#include "support/test_support.hpp"

using namespace caen::ssdp;
using namespace caen::ssdp::test;
using namespace std::literals;

TEST_CASE("query_transmitter: default destination is the SSDP multicast group", "[integration][transmitter]") {
	const query_transmitter transmitter(null_logger());

	REQUIRE(transmitter.get_destination().address().to_string() == "239.255.255.250");
	REQUIRE(transmitter.get_destination().port() == 1900);
}

TEST_CASE("query_transmitter: sends retries identical datagrams", "[integration][transmitter]") {
	loopback_udp_receiver receiver;
	const query_transmitter transmitter(null_logger(), receiver.get_endpoint());
	const discovery_request request("upnp:rootdevice", 2, 2, 3, 5.0);

	const auto begin = std::chrono::steady_clock::now();
	auto socket = transmitter.send(request);
	const auto elapsed = std::chrono::steady_clock::now() - begin;

	REQUIRE(socket);
	REQUIRE(socket->is_open());

	// a fixed delay between sends, none after the last one
	REQUIRE(elapsed >= 200ms);

	const auto datagrams = receiver.receive(4, 500ms);
	REQUIRE(datagrams.size() == 3);
	for (const auto& datagram : datagrams) {
		REQUIRE(datagram == query_transmitter::format_request(request));
		// HOST always names the multicast group
		REQUIRE(datagram.find("HOST: 239.255.255.250:1900\r\n") != std::string::npos);
	}

	socket->close();
	REQUIRE_FALSE(socket->is_open());
}

TEST_CASE("query_transmitter: single datagram has no delay", "[integration][transmitter]") {
	loopback_udp_receiver receiver;
	const query_transmitter transmitter(null_logger(), receiver.get_endpoint());
	const discovery_request request("ssdp:all", 1, 1, 1, 1.0);

	const auto begin = std::chrono::steady_clock::now();
	const auto socket = transmitter.send(request);
	const auto elapsed = std::chrono::steady_clock::now() - begin;

	REQUIRE(elapsed < 100ms);
	REQUIRE(receiver.receive(2, 300ms).size() == 1);
}

TEST_CASE("query_transmitter: returned socket receives the answers", "[integration][transmitter]") {
	mock_ssdp_responder responder("HTTP/1.1 200 OK\r\nLOCATION: http://127.0.0.1/desc.xml\r\n\r\n");
	const query_transmitter transmitter(null_logger(), responder.get_endpoint());

	auto socket = transmitter.send(discovery_request("upnp:rootdevice", 1, 1, 1, 0.5));
	const auto datagram = socket->receive();

	REQUIRE(datagram._source_address == "127.0.0.1");
	REQUIRE(datagram._source_port == responder.get_endpoint().port());
	REQUIRE(datagram._payload == "HTTP/1.1 200 OK\r\nLOCATION: http://127.0.0.1/desc.xml\r\n\r\n");

	// nothing else is sent: next receive times out
	REQUIRE_THROWS_AS(socket->receive(), ex::timeout);
}

TEST_CASE("query_transmitter: send failure raises transmit_error", "[integration][transmitter]") {
	// IPv6 destination on an IPv4 socket
	const query_transmitter transmitter(null_logger(), { boost::asio::ip::address_v6::loopback(), 1900 });

	REQUIRE_THROWS_AS(transmitter.send(discovery_request()), ex::transmit_error);
}
