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
*	\file		discovery_record.hpp
*	\brief		Discovered device
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_DISCOVERY_RECORD_HPP_
#define CAEN_SSDP_INCLUDE_DISCOVERY_RECORD_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "json/json_utilities.hpp"
#include "headers.hpp"

namespace caen {

namespace ssdp {

/**
 * A device that answered the M-SEARCH with a LOCATION header.
 *
 * Never modified after creation.
 */
struct discovery_record {

	discovery_record(std::string ip_address, std::uint16_t port, parsed_headers headers, std::optional<std::string> location, std::optional<std::string> descriptor)
	: _ip_address(std::move(ip_address))
	, _port{port}
	, _headers(std::move(headers))
	, _location(std::move(location))
	, _descriptor(std::move(descriptor)) {}

	discovery_record()
	: _ip_address{}
	, _port{}
	, _headers{}
	, _location{}
	, _descriptor{} {}

	/**
	 * Convert JSON to discovery_record
	 * @param args any input of nlohmann::json::parse representing a JSON
	 * @return an instance of discovery_record parsing the input content
	 */
	template <typename... Args>
	static discovery_record marshal(Args&& ...args) {
		return nlohmann::json::parse(std::forward<Args>(args)...);
	}

	/**
	 * Convert discovery_record to JSON
	 * @return the JSON with no indentation
	 */
	nlohmann::json::string_t unmarshal() const {
		return nlohmann::json(*this).dump();
	}

	discovery_record(const discovery_record&) = default;
	discovery_record(discovery_record&&) = default;
	~discovery_record() = default;

	discovery_record& operator=(const discovery_record&) = default;
	discovery_record& operator=(discovery_record&&) = default;

	const std::string& get_ip_address() const noexcept { return _ip_address; }
	std::uint16_t get_port() const noexcept { return _port; }
	const parsed_headers& get_headers() const noexcept { return _headers; }
	const std::optional<std::string>& get_location() const noexcept { return _location; }
	const std::optional<std::string>& get_descriptor() const noexcept { return _descriptor; }

	/**
	 * Descriptor value stored when the follow-up fetch fails
	 */
	static constexpr auto& unavailable_descriptor() noexcept { return "Unavailable"; }

	/**
	 * @return true if the descriptor has been fetched successfully
	 */
	bool has_descriptor() const noexcept {
		return _descriptor && *_descriptor != unavailable_descriptor();
	}

	static constexpr auto& key_ip_address() noexcept { return "ip_address"; }
	static constexpr auto& key_port() noexcept { return "port"; }
	static constexpr auto& key_headers() noexcept { return "headers"; }
	static constexpr auto& key_location() noexcept { return "location"; }
	static constexpr auto& key_descriptor() noexcept { return "device_description"; }

	friend void from_json(const nlohmann::json& j, discovery_record& e) {
		caen::json::get(j, key_ip_address(), e._ip_address);
		caen::json::get(j, key_port(), e._port);
		caen::json::get_if_not_null(j, key_headers(), e._headers);
		caen::json::get_if_not_null(j, key_location(), e._location);
		caen::json::get_if_not_null(j, key_descriptor(), e._descriptor);
	}

	friend void to_json(nlohmann::json& j, const discovery_record& e) {
		caen::json::set(j, key_ip_address(), e._ip_address);
		caen::json::set(j, key_port(), e._port);
		caen::json::set(j, key_headers(), e._headers);
		caen::json::set(j, key_location(), e._location);
		caen::json::set(j, key_descriptor(), e._descriptor);
	}

	friend bool operator==(const discovery_record& lhs, const discovery_record& rhs) {
		return lhs._ip_address == rhs._ip_address
			&& lhs._port == rhs._port
			&& lhs._headers == rhs._headers
			&& lhs._location == rhs._location
			&& lhs._descriptor == rhs._descriptor;
	}

	friend bool operator!=(const discovery_record& lhs, const discovery_record& rhs) {
		return !(lhs == rhs);
	}

private:
	std::string _ip_address;
	std::uint16_t _port;
	parsed_headers _headers;
	std::optional<std::string> _location;
	std::optional<std::string> _descriptor;
};

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_DISCOVERY_RECORD_HPP_ */
