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
*	\file		test_support.cpp
*	\brief
*
******************************************************************************/

#include "support/test_support.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/fmt/fmt.h>

#include "lib_error.hpp"
#include "ssdp_definitions.hpp"

using namespace std::literals;

namespace caen {

namespace ssdp {

namespace test {

std::shared_ptr<spdlog::logger> null_logger(const std::string& name) {
	auto logger = std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
	logger->set_level(spdlog::level::trace);
	return logger;
}

scripted_socket::step scripted_socket::datagram(std::string payload, std::string address, std::uint16_t port, std::chrono::milliseconds delay) {
	return { step::kind::datagram, { std::move(address), port, std::move(payload) }, delay };
}

scripted_socket::step scripted_socket::timeout() {
	return { step::kind::timeout, {}, {} };
}

scripted_socket::step scripted_socket::socket_error() {
	return { step::kind::socket_error, {}, {} };
}

scripted_socket::step scripted_socket::unexpected() {
	return { step::kind::unexpected, {}, {} };
}

scripted_socket::scripted_socket(std::vector<step> steps, std::chrono::milliseconds exhausted_delay)
: _steps(std::make_move_iterator(steps.begin()), std::make_move_iterator(steps.end()))
, _exhausted_delay{exhausted_delay}
, _close_count{std::make_shared<int>(0)}
, _receive_count{std::make_shared<int>(0)}
, _open{true} {
}

raw_datagram scripted_socket::receive() {
	if (!_open)
		throw ex::socket_error("receive on closed socket"s);
	++*_receive_count;
	if (_steps.empty()) {
		std::this_thread::sleep_for(_exhausted_delay);
		throw ex::timeout();
	}
	auto s = std::move(_steps.front());
	_steps.pop_front();
	std::this_thread::sleep_for(s._delay);
	switch (s._kind) {
	case step::kind::datagram:
		return std::move(s._datagram);
	case step::kind::timeout:
		throw ex::timeout();
	case step::kind::socket_error:
		throw ex::socket_error("connection reset"s);
	case step::kind::unexpected:
	default:
		throw std::logic_error("unexpected failure"s);
	}
}

void scripted_socket::close() noexcept {
	++*_close_count;
	_open = false;
}

bool scripted_socket::is_open() const noexcept {
	return _open;
}

scripted_fetcher::scripted_fetcher(std::map<std::string, std::string> documents)
: _documents(std::move(documents)) {
}

std::string scripted_fetcher::fetch(const std::string& url) {
	_requests.emplace_back(url);
	const auto it = _documents.find(url);
	if (it == _documents.end())
		throw ex::descriptor_fetch_error(fmt::format("HTTP status 404 for {}", url));
	return it->second;
}

loopback_http_server::loopback_http_server(std::string response, bool silent)
: loopback_http_server(std::vector<std::string>{std::move(response)}, silent) {
}

loopback_http_server::loopback_http_server(std::vector<std::string> responses)
: loopback_http_server(std::move(responses), false) {
}

loopback_http_server::loopback_http_server(std::vector<std::string> responses, bool silent)
: _io_context{}
, _acceptor(_io_context, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0))
, _socket(_io_context)
, _buffer{}
, _responses(std::make_move_iterator(responses.begin()), std::make_move_iterator(responses.end()))
, _response{}
, _silent{silent}
, _mtx{}
, _requests{}
, _thread{} {
	start_accept();
	_thread = std::thread([this] { _io_context.run(); });
}

loopback_http_server::~loopback_http_server() {
	_io_context.stop();
	_thread.join();
}

std::uint16_t loopback_http_server::get_port() const {
	return _acceptor.local_endpoint().port();
}

std::string loopback_http_server::url(const std::string& target) const {
	return fmt::format("http://127.0.0.1:{}{}", get_port(), target);
}

std::string loopback_http_server::get_request() const {
	std::lock_guard<std::mutex> lk{_mtx};
	return _requests.empty() ? std::string{} : _requests.front();
}

std::vector<std::string> loopback_http_server::get_requests() const {
	std::lock_guard<std::mutex> lk{_mtx};
	return _requests;
}

void loopback_http_server::start_accept() {
	_acceptor.async_accept(_socket, [this](const boost::system::error_code& ec) { on_accept(ec); });
}

void loopback_http_server::on_accept(const boost::system::error_code& ec) {
	if (ec)
		return;
	boost::asio::async_read_until(_socket, _buffer, "\r\n\r\n", [this](const boost::system::error_code& read_ec, std::size_t) { on_request(read_ec); });
}

void loopback_http_server::on_request(const boost::system::error_code& ec) {
	if (ec)
		return;
	{
		const auto data = _buffer.data();
		std::lock_guard<std::mutex> lk{_mtx};
		_requests.emplace_back(boost::asio::buffers_begin(data), boost::asio::buffers_end(data));
	}
	_buffer.consume(_buffer.size());
	if (_silent) {
		// completes when the client gives up and closes the connection
		boost::asio::async_read(_socket, _buffer, [](const boost::system::error_code&, std::size_t) {});
		return;
	}
	_response = std::move(_responses.front());
	_responses.pop_front();
	// the client may close before the end of a large response: write errors are expected
	boost::asio::async_write(_socket, boost::asio::buffer(_response), [this](const boost::system::error_code&, std::size_t) {
		boost::system::error_code ignored;
		_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
		_socket.close(ignored);
		if (!_responses.empty())
			start_accept();
	});
}

std::uint16_t unused_tcp_port() {
	boost::asio::io_context io_context;
	boost::asio::ip::tcp::acceptor acceptor(io_context, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
	const auto port = acceptor.local_endpoint().port();
	acceptor.close();
	return port;
}

loopback_udp_receiver::loopback_udp_receiver()
: _io_context{}
, _socket(_io_context, boost::asio::ip::udp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {
	_socket.non_blocking(true);
}

boost::asio::ip::udp::endpoint loopback_udp_receiver::get_endpoint() const {
	return _socket.local_endpoint();
}

std::vector<std::string> loopback_udp_receiver::receive(std::size_t count, std::chrono::milliseconds timeout) {
	std::vector<std::string> res;
	std::vector<char> buffer(max_size::datagram);
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	while (res.size() < count && std::chrono::steady_clock::now() < deadline) {
		boost::asio::ip::udp::endpoint sender;
		boost::system::error_code ec;
		const auto size = _socket.receive_from(boost::asio::buffer(buffer), sender, 0, ec);
		if (ec == boost::asio::error::would_block) {
			std::this_thread::sleep_for(10ms);
			continue;
		}
		if (ec)
			throw boost::system::system_error(ec);
		res.emplace_back(buffer.data(), size);
	}
	return res;
}

mock_ssdp_responder::mock_ssdp_responder(std::string response)
: _io_context{}
, _socket(_io_context, boost::asio::ip::udp::endpoint(boost::asio::ip::address_v4::loopback(), 0))
, _sender{}
, _buffer(max_size::datagram)
, _response(std::move(response))
, _query_count{0}
, _mtx{}
, _first_query{}
, _thread{} {
	start_receive();
	_thread = std::thread([this] { _io_context.run(); });
}

mock_ssdp_responder::~mock_ssdp_responder() {
	_io_context.stop();
	_thread.join();
}

boost::asio::ip::udp::endpoint mock_ssdp_responder::get_endpoint() const {
	return _socket.local_endpoint();
}

std::string mock_ssdp_responder::get_first_query() const {
	std::lock_guard<std::mutex> lk{_mtx};
	return _first_query;
}

void mock_ssdp_responder::start_receive() {
	_socket.async_receive_from(boost::asio::buffer(_buffer), _sender, [this](const boost::system::error_code& ec, std::size_t size) {
		if (ec)
			return;
		if (_query_count++ == 0) {
			{
				std::lock_guard<std::mutex> lk{_mtx};
				_first_query.assign(_buffer.data(), size);
			}
			// retransmissions of the same query are not answered again
			boost::system::error_code send_ec;
			_socket.send_to(boost::asio::buffer(_response), _sender, 0, send_ec);
		}
		start_receive();
	});
}

} // namespace test

} // namespace ssdp

} // namespace caen
