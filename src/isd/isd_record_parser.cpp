/**
 * @file isd_record_parser.cpp
 * @brief Implementation of the parser of ISD fixed-width lines
 * @author Laurent Georget
 * @date 2026-02-17
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

#include <chrono>
#include <string>
#include <string_view>
#include <regex>
#include <algorithm>
#include <cctype>
#include <utility>

#include <date/date.h>

#include "../errors.h"
#include "field_codec.h"
#include "isd_record.h"
#include "isd_record_parser.h"

namespace meteoisd
{

namespace chrono = std::chrono;
using namespace isd_layout;

namespace
{
	const std::regex usafIdPattern{"^\\w{6}$"};
	const std::regex wbanIdPattern{"^\\d{5}$"};
	const std::regex integerNumber{"^[-+]?\\d+$"};

	inline std::string_view extract(std::string_view line, FieldSpan span)
	{
		return line.substr(span.begin, span.length());
	}

	inline char extractCode(std::string_view line, FieldSpan span)
	{
		return line[span.begin];
	}

	int requiredInteger(std::string_view raw, const char* name)
	{
		std::string value{field_codec::trim(raw)};
		if (!std::regex_match(value, integerNumber))
			throw FormatError{std::string{name} + " '" + value + "' is not an integer"};
		return std::stoi(value);
	}

	std::string requiredText(std::string_view raw, const std::regex& pattern, const char* name)
	{
		std::string value{raw};
		if (!std::regex_match(value, pattern))
			throw FormatError{std::string{name} + " '" + value + "' is malformed"};
		return value;
	}

	/**
	 * Optional fields get an error message mentioning the field in error
	 */
	template<typename Decoder>
	auto decodeField(Decoder&& decoder, const char* name) -> decltype(decoder())
	{
		try {
			return decoder();
		} catch (const FormatError& e) {
			throw FormatError{std::string{name} + ": " + e.what()};
		}
	}

	ControlData parseControlData(std::string_view line)
	{
		ControlData control;
		control.totalVariableCharacters = requiredInteger(extract(line, TOTAL_VARIABLE_CHARACTERS),
			"total variable characters");
		control.usafId = requiredText(extract(line, USAF_ID), usafIdPattern, "USAF identifier");
		control.wbanId = requiredText(extract(line, WBAN_ID), wbanIdPattern, "WBAN identifier");
		control.datetime = parseDatetime(extract(line, DATETIME));
		control.dataSourceFlag = decodeField([&]() {
			return field_codec::decodeText(extract(line, DATA_SOURCE_FLAG), 1);
		}, "data source flag");
		control.latitude = decodeField([&]() {
			return field_codec::decodeScaled(extract(line, LATITUDE), COORDINATES_SCALING_FACTOR);
		}, "latitude");
		control.longitude = decodeField([&]() {
			return field_codec::decodeScaled(extract(line, LONGITUDE), COORDINATES_SCALING_FACTOR);
		}, "longitude");
		control.reportTypeCode = decodeField([&]() {
			return field_codec::decodeText(extract(line, REPORT_TYPE_CODE), 5);
		}, "report type code");
		control.elevation = decodeField([&]() {
			return field_codec::decodeInteger(extract(line, ELEVATION));
		}, "elevation");
		control.callLetterId = decodeField([&]() {
			return field_codec::decodeText(extract(line, CALL_LETTER_ID), 5);
		}, "call letter identifier");

		// the quality control process name is mandatory, 9s are not a missing value here
		control.qcProcessName = std::string{extract(line, QC_PROCESS_NAME)};
		if (control.qcProcessName.length() > 4)
			throw FormatError{"quality control process name '" + control.qcProcessName + "' is too long"};

		return control;
	}

	WindObservation parseWind(std::string_view line)
	{
		WindObservation wind;
		wind.directionAngle = decodeField([&]() {
			return field_codec::decodeInteger(extract(line, WIND_DIRECTION));
		}, "wind direction");
		wind.directionQualityCode = extractCode(line, WIND_DIRECTION_QUALITY);
		wind.typeCode = field_codec::decodeText(extract(line, WIND_TYPE), 1);
		wind.speedRate = decodeField([&]() {
			return field_codec::decodeScaled(extract(line, WIND_SPEED), WIND_SPEED_SCALING_FACTOR);
		}, "wind speed");
		wind.speedQualityCode = extractCode(line, WIND_SPEED_QUALITY);
		return wind;
	}

	SkyConditionObservation parseSkyCondition(std::string_view line)
	{
		SkyConditionObservation ceiling;
		ceiling.ceilingHeight = decodeField([&]() {
			return field_codec::decodeInteger(extract(line, CEILING_HEIGHT));
		}, "ceiling height");
		ceiling.ceilingQualityCode = extractCode(line, CEILING_QUALITY);
		ceiling.ceilingDeterminationCode = field_codec::decodeText(extract(line, CEILING_DETERMINATION), 1);
		ceiling.cavokCode = field_codec::decodeText(extract(line, CAVOK), 1);
		return ceiling;
	}

	VisibilityObservation parseVisibility(std::string_view line)
	{
		VisibilityObservation visibility;
		visibility.distance = decodeField([&]() {
			return field_codec::decodeInteger(extract(line, VISIBILITY_DISTANCE));
		}, "visibility distance");
		visibility.distanceQualityCode = extractCode(line, VISIBILITY_QUALITY);
		visibility.variabilityCode = field_codec::decodeText(extract(line, VISIBILITY_VARIABILITY), 1);
		visibility.variabilityQualityCode = extractCode(line, VISIBILITY_VARIABILITY_QUALITY);
		return visibility;
	}

	TemperatureObservation parseTemperature(std::string_view line, FieldSpan value, FieldSpan quality,
		const char* name)
	{
		TemperatureObservation temperature;
		temperature.temperatureC = decodeField([&]() {
			return field_codec::decodeScaled(extract(line, value), TEMPERATURE_SCALING_FACTOR);
		}, name);
		temperature.qualityCode = extractCode(line, quality);
		return temperature;
	}

	PressureObservation parsePressure(std::string_view line)
	{
		PressureObservation pressure;
		pressure.pressure = decodeField([&]() {
			return field_codec::decodeScaled(extract(line, SEA_LEVEL_PRESSURE), PRESSURE_SCALING_FACTOR);
		}, "sea level pressure");
		pressure.qualityCode = extractCode(line, SEA_LEVEL_PRESSURE_QUALITY);
		return pressure;
	}
}

date::sys_seconds parseDatetime(std::string_view token)
{
	std::string value{token};
	if (value.length() != DATETIME.length() ||
	    !std::all_of(value.cbegin(), value.cend(), [](unsigned char c) { return std::isdigit(c); }))
		throw FormatError{"datetime '" + value + "' is not formatted as YYYYMMDDHHMM"};

	int y = std::stoi(value.substr(0, 4));
	unsigned int m = std::stoul(value.substr(4, 2));
	unsigned int d = std::stoul(value.substr(6, 2));
	int h = std::stoi(value.substr(8, 2));
	int min = std::stoi(value.substr(10, 2));

	date::year_month_day ymd{date::year{y}, date::month{m}, date::day{d}};
	if (!ymd.ok())
		throw FormatError{"datetime '" + value + "': day is out of range for month"};
	if (h > 23 || min > 59)
		throw FormatError{"datetime '" + value + "': time of day is out of range"};

	return date::sys_days{ymd} + chrono::hours{h} + chrono::minutes{min};
}

IsdRecord parseLine(std::string_view line)
{
	if (line.length() < FIXED_SECTION_LENGTH)
		throw FormatError{"line is " + std::to_string(line.length()) + " characters long, expected at least " +
			std::to_string(FIXED_SECTION_LENGTH)};

	ControlData control = parseControlData(line);

	MandatoryData mandatory;
	mandatory.wind = parseWind(line);
	mandatory.ceiling = parseSkyCondition(line);
	mandatory.visibility = parseVisibility(line);
	mandatory.airTemperature = parseTemperature(line, AIR_TEMPERATURE, AIR_TEMPERATURE_QUALITY, "air temperature");
	mandatory.dewPoint = parseTemperature(line, DEW_POINT, DEW_POINT_QUALITY, "dew point");
	mandatory.seaLevelPressure = parsePressure(line);

	return IsdRecord{std::move(control), std::move(mandatory)};
}

}
