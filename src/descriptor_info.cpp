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
*	\file		descriptor_info.cpp
*	\brief
*
******************************************************************************/

#include "descriptor_info.hpp"

#include <sstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

namespace caen {

namespace ssdp {

std::optional<descriptor_info> parse_descriptor_info(const std::string& xml) {

	boost::property_tree::ptree tree;

	try {
		std::istringstream xml_stream(xml);
		// property_tree XML support is very limited but seems enough for UPnP descriptions
		boost::property_tree::read_xml(xml_stream, tree, boost::property_tree::xml_parser::trim_whitespace);
	}
	catch (const boost::property_tree::ptree_error&) {
		return std::nullopt;
	}

	const auto device = tree.get_child_optional("root.device");
	if (!device)
		return std::nullopt;

	descriptor_info info;
	info._device_type = device->get("deviceType", std::string{});
	info._friendly_name = device->get("friendlyName", std::string{});
	info._manufacturer = device->get("manufacturer", std::string{});
	info._model_name = device->get("modelName", std::string{});
	info._serial_number = device->get("serialNumber", std::string{});
	info._udn = device->get("UDN", std::string{});
	return info;
}

} // namespace ssdp

} // namespace caen
