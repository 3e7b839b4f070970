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
*	\file		json_utilities.hpp
*	\brief		JSON utilities
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_JSON_JSON_UTILITIES_HPP_
#define CAEN_SSDP_INCLUDE_JSON_JSON_UTILITIES_HPP_

#include <optional>
#include <utility>

#include <nlohmann/json.hpp>

namespace caen {

namespace json {

template <typename BasicJsonType, typename T, typename TKey>
void get(const BasicJsonType& j, TKey&& key, T& value) {
	j.at(std::forward<TKey>(key)).get_to(value); // may throw
}

template <typename BasicJsonType, typename T, typename TKey>
void get_if_not_null(const BasicJsonType& j, TKey&& key, T& value) {
	const auto it = j.find(std::forward<TKey>(key));
	if (it != j.end() && !it->is_null())
		it->get_to(value);
}

/**
 * Optional version: missing or null keys reset the value.
 */
template <typename BasicJsonType, typename T, typename TKey>
void get_if_not_null(const BasicJsonType& j, TKey&& key, std::optional<T>& value) {
	const auto it = j.find(std::forward<TKey>(key));
	if (it != j.end() && !it->is_null())
		value = it->template get<T>();
	else
		value.reset();
}

template <typename BasicJsonType, typename T, typename TKey>
void set(BasicJsonType& j, TKey&& key, T&& value) {
	j[std::forward<TKey>(key)] = std::forward<T>(value);
}

/**
 * Optional version: empty optionals are stored as null.
 */
template <typename BasicJsonType, typename T, typename TKey>
void set(BasicJsonType& j, TKey&& key, const std::optional<T>& value) {
	if (value)
		j[std::forward<TKey>(key)] = *value;
	else
		j[std::forward<TKey>(key)] = nullptr;
}

} // namespace json

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_JSON_JSON_UTILITIES_HPP_ */
