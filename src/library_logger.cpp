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
*	\file		library_logger.cpp
*	\brief
*
******************************************************************************/

#include "library_logger.hpp"

#include <array>
#include <utility>
#include <type_traits>

#include <boost/config.hpp>
#include <boost/static_assert.hpp>
#include <boost/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <nlohmann/json.hpp>

#include "ssdp_definitions.hpp"

using namespace std::literals;

namespace caen {

namespace ssdp {

namespace library_logger {

namespace {

void log_library_versions() {

	auto int_to_triplet = [](int v) -> std::array<int, 3> { return { (v / 10000), (v / 100) % 100, v % 100 }; };
	auto boost_int_to_triplet = [](int v) -> std::array<int, 3> { return { (v / 100000), (v / 100) % 1000, v % 100 }; };

	static constexpr auto caen_ssdp_version = CAEN_SSDP_VERSION_STRING ""sv;
	static constexpr auto compiler_version = BOOST_COMPILER ""sv;
	static constexpr auto platform_name = BOOST_PLATFORM ""sv;
	static constexpr auto stdlib_version = BOOST_STDLIB ""sv;
	static constexpr std::array<int, 3> json_version{ NLOHMANN_JSON_VERSION_MAJOR, NLOHMANN_JSON_VERSION_MINOR, NLOHMANN_JSON_VERSION_PATCH };
	static constexpr std::array<int, 3> spdlog_version{ SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH };
	static constexpr auto fmt_version = FMT_VERSION;
	static constexpr auto boost_version = BOOST_VERSION;

	spdlog::debug("built on {} {}", __DATE__, __TIME__);
	spdlog::debug("compiled with {} on {}", compiler_version, platform_name);
	spdlog::debug("stdlib version: {}", stdlib_version);
	spdlog::debug("caen-ssdp version: {}", caen_ssdp_version);
	spdlog::debug("JSON for Modern C++ version: {}", fmt::join(json_version, "."));
	spdlog::debug("spdlog version: {}", fmt::join(spdlog_version, "."));
	spdlog::debug("{{fmt}} version: {}", fmt::join(int_to_triplet(fmt_version), "."));
	spdlog::debug("Boost version: {}", fmt::join(boost_int_to_triplet(boost_version), "."));

}

// sink singleton
template<typename T, typename... Args>
std::shared_ptr<spdlog::sinks::sink> sink(Args&& ...args) {
	BOOST_STATIC_ASSERT(std::is_base_of<spdlog::sinks::sink, T>::value);
	static auto sink_instance = std::make_shared<T>(std::forward<Args>(args)...);
	return sink_instance;
}

// stdout is reserved to the command output (e.g. JSON)
std::shared_ptr<spdlog::sinks::sink> stderr_sink() {
	using sink_type = spdlog::sinks::stderr_color_sink_mt;
	return sink<sink_type>();
}

constexpr auto& log_pattern() noexcept {
	return "%Y-%m-%d %H:%M:%S,%e - %^%l%$ - [%n] %v";
}

} // unnamed namespace

void init(spdlog::level::level_enum level) {

	/*
	 * Important notes about logger:
	 * - loggers are not registered, components receive them by injection
	 * - SPDLOG_LOGGER_TRACE is not even compiled unless macro SPDLOG_ACTIVE_LEVEL is redefined at compile time
	 */
	spdlog::set_automatic_registration(false);

	// pattern is cloned on every logger created after this call
	spdlog::set_pattern(log_pattern());

	// set the default level and then invoke load_env_levels to override the default value using SPDLOG_LEVEL
	spdlog::set_level(level);
	spdlog::cfg::load_env_levels();

	spdlog::flush_on(spdlog::level::warn);

	// create the default logger with these settings
	spdlog::set_default_logger(create_logger("default"s));

	log_library_versions();
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
	spdlog::sinks_init_list sink_list{
		stderr_sink(),
	};
	return spdlog::create<spdlog::sinks::dist_sink_mt>(name, std::move(sink_list));
}

} // namespace library_logger

} // namespace ssdp

} // namespace caen
