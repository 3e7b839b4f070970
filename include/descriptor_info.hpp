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
*	\file		descriptor_info.hpp
*	\brief		UPnP device description summary
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_DESCRIPTOR_INFO_HPP_
#define CAEN_SSDP_INCLUDE_DESCRIPTOR_INFO_HPP_

#include <optional>
#include <string>

namespace caen {

namespace ssdp {

/**
 * Summary of a UPnP device description document.
 */
struct descriptor_info {
	std::string _device_type;
	std::string _friendly_name;
	std::string _manufacturer;
	std::string _model_name;
	std::string _serial_number;
	std::string _udn;
};

/**
 * Extract the root device summary from a UPnP device description.
 * @param xml	the device description document
 * @return the summary, or an empty optional if the document is not a UPnP device description
 */
std::optional<descriptor_info> parse_descriptor_info(const std::string& xml);

} // namespace ssdp

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_DESCRIPTOR_INFO_HPP_ */
