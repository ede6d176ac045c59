/**
 * @file field_codec.cpp
 * @brief Implementation of the decoding functions for ISD fixed-width fields
 * @author Laurent Georget
 * @date 2026-02-16
 */
/*
 * Copyright (C) 2026  SAS Météo Concept <contact@meteo-concept.fr>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <cctype>
#include <string>
#include <string_view>
#include <regex>
#include <stdexcept>

#include "../errors.h"
#include "field_codec.h"

namespace meteoisd
{

namespace field_codec
{

namespace
{
	const std::regex missingValue{"^[-+]?9+$"};
	const std::regex decimalNumber{"^[-+]?(\\d+\\.?\\d*|\\.\\d+)([eE][-+]?\\d+)?$"};
	const std::regex integerNumber{"^[-+]?\\d+$"};
}

std::string_view trim(std::string_view raw)
{
	while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front())))
		raw.remove_prefix(1);
	while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back())))
		raw.remove_suffix(1);
	return raw;
}

bool isMissing(std::string_view raw)
{
	std::string value{trim(raw)};
	return std::regex_match(value, missingValue);
}

std::optional<FieldValue> decode(std::string_view raw, double scalingFactor)
{
	if (isMissing(raw))
		return std::nullopt;

	if (scalingFactor != 1)
		return FieldValue{*decodeScaled(raw, scalingFactor)};

	return FieldValue{std::string{trim(raw)}};
}

std::optional<double> decodeScaled(std::string_view raw, double scalingFactor)
{
	if (isMissing(raw))
		return std::nullopt;

	std::string value{trim(raw)};
	if (!std::regex_match(value, decimalNumber))
		throw FormatError{"'" + value + "' is not a number"};

	try {
		return std::stod(value) / scalingFactor;
	} catch (const std::out_of_range&) {
		throw FormatError{"'" + value + "' is out of range"};
	}
}

std::optional<int> decodeInteger(std::string_view raw)
{
	if (isMissing(raw))
		return std::nullopt;

	std::string value{trim(raw)};
	if (!std::regex_match(value, integerNumber))
		throw FormatError{"'" + value + "' is not an integer"};

	try {
		return std::stoi(value);
	} catch (const std::out_of_range&) {
		throw FormatError{"'" + value + "' is out of range"};
	}
}

std::optional<std::string> decodeText(std::string_view raw, std::size_t maxLength)
{
	if (isMissing(raw))
		return std::nullopt;

	std::string value{trim(raw)};
	if (value.length() > maxLength)
		throw FormatError{"'" + value + "' is longer than " + std::to_string(maxLength) + " characters"};
	return value;
}

}

}
