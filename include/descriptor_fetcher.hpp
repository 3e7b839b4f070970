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
*	\file		descriptor_fetcher.hpp
*	\brief		Device description retrieval over HTTP
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_DESCRIPTOR_FETCHER_HPP_
#define CAEN_SSDP_INCLUDE_DESCRIPTOR_FETCHER_HPP_

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

#include <boost/core/noncopyable.hpp>
#include <boost/static_assert.hpp>
#include <spdlog/spdlog.h>

#include "headers.hpp"
#include "ssdp_definitions.hpp"

namespace caen {

namespace ssdp {

/**
 * Follow-up retrieval of the document at a LOCATION url.
 */
struct descriptor_fetcher : private boost::noncopyable {

	virtual ~descriptor_fetcher() = default;

	/**
	 * @param url		the LOCATION header value
	 * @return the document
	 * @throw ex::descriptor_fetch_error on any transport or status error
	 */
	virtual std::string fetch(const std::string& url) = 0;

};

BOOST_STATIC_ASSERT(std::is_abstract<descriptor_fetcher>::value);
BOOST_STATIC_ASSERT(std::has_virtual_destructor<descriptor_fetcher>::value);

struct url_data {
	std::string _scheme;
	std::string _host;
	std::string _port;
	std::string _target;	// path and query
};

/**
 * Split an http URL into its components.
 * Port defaults to 80, target defaults to "/".
 * @throw ex::descriptor_fetch_error if the url is not a valid http URL
 */
url_data parse_url(const std::string& url);

struct http_response {
	int _status;
	parsed_headers _headers;	// upper case names
	std::string _body;			// de-chunked
};

/**
 * Parse a complete HTTP/1.x response, whatever its status.
 * @param response	status line, headers and body
 * @throw ex::descriptor_fetch_error on invalid responses
 */
http_response parse_http_response(std::string_view response);

/**
 * Extract the body from a complete HTTP/1.x response.
 * @param response	status line, headers and body
 * @return the body, de-chunked if needed
 * @throw ex::descriptor_fetch_error on invalid responses or status not in 2xx
 */
std::string extract_http_body(std::string_view response);

/**
 * @return true for the statuses carrying a Location to follow
 */
bool is_redirect(int status) noexcept;

/**
 * Resolve a Location header value against the url of the request that returned it.
 * Absolute urls are returned unchanged.
 */
std::string resolve_location(const url_data& base, const std::string& location);

/**
 * Minimal synchronous HTTP/1.1 client, over Boost.ASIO.
 */
struct http_descriptor_fetcher : public descriptor_fetcher {

	/**
	 * @param logger	logger
	 * @param timeout	timeout of the whole fetch, redirects included, from the first resolve to the end of the last response
	 */
	explicit http_descriptor_fetcher(std::shared_ptr<spdlog::logger> logger, std::chrono::milliseconds timeout = defaults::descriptor_timeout);

	std::string fetch(const std::string& url) override;

	std::chrono::milliseconds get_timeout() const noexcept { return _timeout; }

private:

	static constexpr auto& http_request() noexcept {
		return "GET {} HTTP/1.1\r\nHost: {}\r\nAccept: */*\r\nConnection: close\r\n\r\n";
	}

	// single request, returns the raw response
	std::string exchange(const url_data& data, std::chrono::milliseconds timeout);

	std::shared_ptr<spdlog::logger> _logger;
	const std::chrono::milliseconds _timeout;
};

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_DESCRIPTOR_FETCHER_HPP_ */
