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
*	\file		http_descriptor_fetcher.cpp
*	\brief
*
******************************************************************************/

#include "descriptor_fetcher.hpp"

#include <charconv>
#include <cstddef>
#include <regex>
#include <utility>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio.hpp>
#include <spdlog/fmt/fmt.h>

#include "headers.hpp"
#include "lib_error.hpp"

using namespace std::literals;

namespace caen {

namespace ssdp {

namespace {

template <typename Number>
Number parse_number(std::string_view value, int base) {
	Number res{};
	const auto trimmed = boost::algorithm::trim_copy(std::string(value));
	const auto first = trimmed.data();
	const auto last = trimmed.data() + trimmed.size();
	const auto conv = std::from_chars(first, last, res, base);
	if (trimmed.empty() || conv.ec != std::errc{} || conv.ptr != last)
		throw ex::descriptor_fetch_error(fmt::format("invalid number: {}", value));
	return res;
}

std::string decode_chunked(std::string_view body) {
	std::string res;
	std::size_t pos{0};
	for (;;) {
		const auto line_end = body.find("\r\n"sv, pos);
		if (line_end == std::string_view::npos)
			throw ex::descriptor_fetch_error("truncated chunked body"s);
		auto size_line = body.substr(pos, line_end - pos);
		// ignore chunk extensions
		size_line = size_line.substr(0, size_line.find(';'));
		const auto chunk_size = parse_number<std::size_t>(size_line, 16);
		pos = line_end + 2;
		if (chunk_size == 0)
			break;
		if (chunk_size > body.size() - pos)
			throw ex::descriptor_fetch_error("truncated chunk"s);
		res.append(body.data() + pos, chunk_size);
		// skip data and its CRLF
		pos += chunk_size + 2;
		if (pos > body.size())
			throw ex::descriptor_fetch_error("truncated chunk"s);
	}
	return res;
}

} // unnamed namespace

url_data parse_url(const std::string& url) {

	// host can be an RFC 2732 IPv6 literal in brackets
	static const std::regex url_regex(R"((https?)://(\[[^\]/ ]+\]|[^/ :?#\[\]]+)(?::([0-9]*))?(/[^ #?]*)?(?:\?([^ #]*))?(?:#([^ ]*))?)"s, std::regex::ECMAScript | std::regex::icase);
	std::smatch what;

	if (!std::regex_match(url, what, url_regex))
		throw ex::descriptor_fetch_error(fmt::format("invalid url: {}", url));

	const std::string scheme = what[1];
	const std::string host = what[2];
	const std::string port = what[3];
	const std::string path = what[4];
	const std::string query = what[5];

	if (!boost::algorithm::iequals(scheme, "http"sv))
		throw ex::descriptor_fetch_error(fmt::format("unsupported scheme: {}", scheme));

	url_data data;
	data._scheme = "http"s;
	data._host = (host.front() == '[') ? host.substr(1, host.size() - 2) : host;
	data._port = port.empty() ? "80"s : port;
	data._target = path.empty() ? "/"s : path;
	if (what[5].matched)
		data._target += fmt::format("?{}", query);

	return data;
}

http_response parse_http_response(std::string_view response) {

	auto header_end = response.find("\r\n\r\n"sv);
	std::size_t separator_size{4};
	if (header_end == std::string_view::npos) {
		// tolerate bare LF line terminators
		header_end = response.find("\n\n"sv);
		separator_size = 2;
	}
	if (header_end == std::string_view::npos)
		throw ex::descriptor_fetch_error("incomplete response header"s);

	const auto header_block = response.substr(0, header_end);
	auto body = response.substr(header_end + separator_size);

	const auto status_line = header_block.substr(0, header_block.find_first_of("\r\n"sv));
	if (!boost::algorithm::starts_with(status_line, "HTTP/"sv))
		throw ex::descriptor_fetch_error("invalid response"s);

	// HTTP/1.1 200 OK
	const auto code_begin = status_line.find(' ');
	const auto code_end = status_line.find(' ', code_begin + 1);
	if (code_begin == std::string_view::npos)
		throw ex::descriptor_fetch_error(fmt::format("invalid status line: {}", status_line));
	const auto code_view = status_line.substr(code_begin + 1, code_end == std::string_view::npos ? std::string_view::npos : code_end - code_begin - 1);

	http_response res;
	res._status = parse_number<int>(code_view, 10);
	res._headers = parse_headers(header_block);

	const auto transfer_encoding = res._headers.find("TRANSFER-ENCODING"s);
	if (transfer_encoding != res._headers.end() && boost::algorithm::icontains(transfer_encoding->second, "chunked"sv)) {
		res._body = decode_chunked(body);
		return res;
	}

	const auto content_length = res._headers.find("CONTENT-LENGTH"s);
	if (content_length != res._headers.end()) {
		const auto length = parse_number<std::size_t>(content_length->second, 10);
		if (length < body.size())
			body = body.substr(0, length);
	}

	res._body = std::string(body);
	return res;
}

std::string extract_http_body(std::string_view response) {
	auto res = parse_http_response(response);
	if (res._status < 200 || res._status >= 300)
		throw ex::descriptor_fetch_error(fmt::format("HTTP status {}", res._status));
	return std::move(res._body);
}

bool is_redirect(int status) noexcept {
	switch (status) {
	case 301:
	case 302:
	case 303:
	case 307:
	case 308:
		return true;
	default:
		return false;
	}
}

std::string resolve_location(const url_data& base, const std::string& location) {

	static const std::regex scheme_regex(R"(^[a-z][a-z0-9+.\-]*:)"s, std::regex::ECMAScript | std::regex::icase);

	if (std::regex_search(location, scheme_regex))
		return location;

	// network-path reference
	if (boost::algorithm::starts_with(location, "//"sv))
		return fmt::format("{}:{}", base._scheme, location);

	const auto authority = base._host.find(':') != std::string::npos
		? fmt::format("[{}]:{}", base._host, base._port)
		: fmt::format("{}:{}", base._host, base._port);

	if (boost::algorithm::starts_with(location, "/"sv))
		return fmt::format("{}://{}{}", base._scheme, authority, location);

	// relative to the directory of the current path
	const auto path = base._target.substr(0, base._target.find('?'));
	const auto directory = path.substr(0, path.rfind('/') + 1);
	return fmt::format("{}://{}{}{}", base._scheme, authority, directory, location);
}

http_descriptor_fetcher::http_descriptor_fetcher(std::shared_ptr<spdlog::logger> logger, std::chrono::milliseconds timeout)
: _logger{std::move(logger)}
, _timeout{timeout} {
}

std::string http_descriptor_fetcher::fetch(const std::string& url) {

	// a single deadline for the whole redirect chain
	const auto deadline = std::chrono::steady_clock::now() + _timeout;

	auto current_url = url;
	for (int redirects = 0;; ++redirects) {

		const auto data = parse_url(current_url);

		const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
		if (remaining <= std::chrono::milliseconds::zero())
			throw ex::descriptor_fetch_error(fmt::format("timeout after {} ms", _timeout.count()));

		auto response = parse_http_response(exchange(data, remaining));

		if (is_redirect(response._status)) {
			const auto location = response._headers.find("LOCATION"s);
			if (location == response._headers.end() || location->second.empty())
				throw ex::descriptor_fetch_error(fmt::format("HTTP status {} without Location", response._status));
			if (redirects == defaults::max_redirects)
				throw ex::descriptor_fetch_error(fmt::format("more than {} redirects", defaults::max_redirects));
			current_url = resolve_location(data, location->second);
			_logger->debug("{} redirected to {} (status {})", url, current_url, response._status);
			continue;
		}

		if (response._status < 200 || response._status >= 300)
			throw ex::descriptor_fetch_error(fmt::format("HTTP status {}", response._status));

		return std::move(response._body);
	}
}

std::string http_descriptor_fetcher::exchange(const url_data& data, std::chrono::milliseconds timeout) {

	// IPv6 literals are the only hosts containing colons
	const auto host_header = data._host.find(':') != std::string::npos
		? fmt::format("[{}]:{}", data._host, data._port)
		: fmt::format("{}:{}", data._host, data._port);
	const auto request = fmt::format(http_request(), data._target, host_header);

	SPDLOG_LOGGER_DEBUG(_logger, "GET {} from {}:{}", data._target, data._host, data._port);

	boost::asio::io_context io_context;
	boost::asio::ip::tcp::resolver resolver(io_context);
	boost::asio::ip::tcp::socket socket(io_context);
	boost::asio::streambuf response_buffer(max_size::http_response);

	boost::system::error_code ec;
	bool too_large{false};

	// resolve -> connect -> write -> read until EOF, everything bounded by a single deadline
	resolver.async_resolve(data._host, data._port, [&](const boost::system::error_code& resolve_ec, const boost::asio::ip::tcp::resolver::results_type& endpoints) {
		if (resolve_ec) {
			ec = resolve_ec;
			return;
		}
		boost::asio::async_connect(socket, endpoints, [&](const boost::system::error_code& connect_ec, const boost::asio::ip::tcp::endpoint&) {
			if (connect_ec) {
				ec = connect_ec;
				return;
			}
			boost::asio::async_write(socket, boost::asio::buffer(request), [&](const boost::system::error_code& write_ec, std::size_t) {
				if (write_ec) {
					ec = write_ec;
					return;
				}
				boost::asio::async_read(socket, response_buffer, [&](const boost::system::error_code& read_ec, std::size_t) {
					// the read completes without error when the buffer is full
					if (!read_ec && response_buffer.size() == response_buffer.max_size()) {
						too_large = true;
						return;
					}
					// Connection: close, the server closes the connection at the end of the response
					if (read_ec != boost::asio::error::eof)
						ec = read_ec;
				});
			});
		});
	});

	io_context.run_for(timeout);

	if (!io_context.stopped()) {

		// cancel the outstanding operation, then run the io_context again until it completes
		resolver.cancel();
		boost::system::error_code close_ec;
		socket.close(close_ec);
		if (close_ec)
			_logger->warn("socket close failed: {}", close_ec.message());
		io_context.run();

		throw ex::descriptor_fetch_error(fmt::format("timeout after {} ms", _timeout.count()));
	}

	if (too_large)
		throw ex::descriptor_fetch_error(fmt::format("response exceeds {} bytes", max_size::http_response));

	if (ec)
		throw ex::descriptor_fetch_error(ec.message());

	const auto buffers = response_buffer.data();
	std::string response(boost::asio::buffers_begin(buffers), boost::asio::buffers_end(buffers));

	SPDLOG_LOGGER_DEBUG(_logger, "response received (size={})", response.size());

	return response;
}

} // namespace ssdp

} // namespace caen
