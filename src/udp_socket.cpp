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
*	\file		udp_socket.cpp
*	\brief
*
******************************************************************************/

#include "udp_socket.hpp"

#include <cstddef>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <spdlog/fmt/fmt.h>

#include "lib_error.hpp"
#include "ssdp_definitions.hpp"

namespace caen {

namespace ssdp {

struct udp_socket::socket_impl {

	socket_impl(std::shared_ptr<spdlog::logger> logger, std::chrono::milliseconds receive_timeout)
	: _logger{std::move(logger)}
	, _io_context{}
	, _socket(_io_context)
	, _receive_timeout{receive_timeout}
	, _buffer(max_size::datagram) {

		boost::system::error_code ec;

		_socket.open(boost::asio::ip::udp::v4(), ec);
		if (ec)
			throw ex::socket_error(fmt::format("socket open failed: {}", ec.message()));

		_socket.bind(boost::asio::ip::udp::endpoint(boost::asio::ip::address_v4::any(), 0), ec);
		if (ec)
			throw ex::socket_error(fmt::format("socket bind failed: {}", ec.message()));

		_socket.set_option(boost::asio::ip::multicast::hops(multicast::hops), ec); // UPnP default
		if (ec)
			throw ex::socket_error(fmt::format("cannot set multicast hops: {}", ec.message()));

		SPDLOG_LOGGER_DEBUG(_logger, "socket bound on port {} (receive timeout {} ms)", _socket.local_endpoint().port(), _receive_timeout.count());

	}

	~socket_impl() {
		close();
	}

	void send_to(const std::string& payload, const boost::asio::ip::udp::endpoint& destination) {
		boost::system::error_code ec;
		_socket.send_to(boost::asio::buffer(payload), destination, 0, ec);
		if (ec)
			throw ex::socket_error(fmt::format("send to {}:{} failed: {}", destination.address().to_string(), destination.port(), ec.message()));
	}

	raw_datagram receive() {

		if (!_socket.is_open())
			throw ex::socket_error("socket is closed");

		boost::asio::ip::udp::endpoint sender;
		boost::system::error_code ec = boost::asio::error::would_block;
		std::size_t size{};

		_socket.async_receive_from(boost::asio::buffer(_buffer), sender, [&ec, &size](const boost::system::error_code& new_ec, std::size_t s) {
			ec = new_ec;
			size = s;
		});

		run_context_for(_receive_timeout, [this] {
			// cancel the outstanding receive, leaving the socket open for the next one
			boost::system::error_code cancel_ec;
			_socket.cancel(cancel_ec);
			if (cancel_ec)
				_logger->warn("socket cancel failed: {}", cancel_ec.message());

			// run the io_context again until the operation completes: this will set ec to operation_aborted
			_io_context.run();
		});

		if (ec == boost::asio::error::operation_aborted)
			throw ex::timeout();

		if (ec)
			throw ex::socket_error(fmt::format("receive failed: {}", ec.message()));

		return { sender.address().to_string(), sender.port(), std::string(_buffer.data(), size) };
	}

	void close() noexcept {

		if (!_socket.is_open())
			return;

		boost::system::error_code ec;

		_socket.close(ec);
		if (ec)
			_logger->warn("socket close failed: {}", ec.message());
		else
			SPDLOG_LOGGER_DEBUG(_logger, "socket closed");

	}

	template <typename Duration, typename Callable>
	void run_context_for(Duration&& timeout, Callable stopped_callback) {

		_io_context.restart();

		/*
		 * See example at
		 * https://www.boost.org/doc/libs/1_67_0/doc/html/boost_asio/example/cpp03/timeouts/blocking_udp_client.cpp
		 *
		 * Block until the asynchronous operation has completed, or timed out.
		 */
		_io_context.run_for(std::forward<Duration>(timeout));

		/*
		 * If the asynchronous operation completed successfully then the io_context
		 * would have been stopped due to running out of work. If it was not
		 * stopped, then the io_context::run_for call must have timed out.
		 */
		if (!_io_context.stopped())
			stopped_callback();

	}

	std::shared_ptr<spdlog::logger> _logger;
	boost::asio::io_context _io_context;
	boost::asio::ip::udp::socket _socket;
	const std::chrono::milliseconds _receive_timeout;
	std::vector<char> _buffer;
};

udp_socket::udp_socket(std::shared_ptr<spdlog::logger> logger, std::chrono::milliseconds receive_timeout)
: _pimpl{std::make_unique<socket_impl>(std::move(logger), receive_timeout)} {
}

udp_socket::~udp_socket() = default;

void udp_socket::send_to(const std::string& payload, const boost::asio::ip::udp::endpoint& destination) {
	_pimpl->send_to(payload, destination);
}

raw_datagram udp_socket::receive() {
	return _pimpl->receive();
}

void udp_socket::close() noexcept {
	_pimpl->close();
}

bool udp_socket::is_open() const noexcept {
	return _pimpl->_socket.is_open();
}

} // namespace ssdp

} // namespace caen
