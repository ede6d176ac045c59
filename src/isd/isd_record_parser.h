/**
 * @file isd_record_parser.h
 * @brief Definition of the parser of ISD fixed-width lines
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

#ifndef ISD_RECORD_PARSER_H
#define ISD_RECORD_PARSER_H

#include <cstddef>
#include <string_view>

#include <date/date.h>

#include "isd_record.h"

namespace meteoisd
{

namespace isd_layout
{

/**
 * @brief The position of a field in a line, as a half-open range of
 * 0-indexed characters
 */
struct FieldSpan
{
	std::size_t begin;
	std::size_t end;

	constexpr std::size_t length() const
	{
		return end - begin;
	}
};

// Control data section
constexpr FieldSpan TOTAL_VARIABLE_CHARACTERS{0, 4};
constexpr FieldSpan USAF_ID{4, 10};
constexpr FieldSpan WBAN_ID{10, 15};
constexpr FieldSpan DATETIME{15, 27};
constexpr FieldSpan DATA_SOURCE_FLAG{27, 28};
constexpr FieldSpan LATITUDE{28, 34};
constexpr FieldSpan LONGITUDE{34, 41};
constexpr FieldSpan REPORT_TYPE_CODE{41, 46};
constexpr FieldSpan ELEVATION{46, 51};
constexpr FieldSpan CALL_LETTER_ID{51, 56};
constexpr FieldSpan QC_PROCESS_NAME{56, 60};

// Mandatory data section
constexpr FieldSpan WIND_DIRECTION{60, 63};
constexpr FieldSpan WIND_DIRECTION_QUALITY{63, 64};
constexpr FieldSpan WIND_TYPE{64, 65};
constexpr FieldSpan WIND_SPEED{65, 69};
constexpr FieldSpan WIND_SPEED_QUALITY{69, 70};
constexpr FieldSpan CEILING_HEIGHT{70, 75};
constexpr FieldSpan CEILING_QUALITY{75, 76};
constexpr FieldSpan CEILING_DETERMINATION{76, 77};
constexpr FieldSpan CAVOK{77, 78};
constexpr FieldSpan VISIBILITY_DISTANCE{78, 84};
constexpr FieldSpan VISIBILITY_QUALITY{84, 85};
constexpr FieldSpan VISIBILITY_VARIABILITY{85, 86};
constexpr FieldSpan VISIBILITY_VARIABILITY_QUALITY{86, 87};
constexpr FieldSpan AIR_TEMPERATURE{87, 92};
constexpr FieldSpan AIR_TEMPERATURE_QUALITY{92, 93};
constexpr FieldSpan DEW_POINT{93, 98};
constexpr FieldSpan DEW_POINT_QUALITY{98, 99};
constexpr FieldSpan SEA_LEVEL_PRESSURE{99, 104};
constexpr FieldSpan SEA_LEVEL_PRESSURE_QUALITY{104, 105};

//! Length of the control and mandatory data sections, every record is at least this long
constexpr std::size_t FIXED_SECTION_LENGTH = 105;

constexpr double COORDINATES_SCALING_FACTOR = 1000.;
constexpr double WIND_SPEED_SCALING_FACTOR = 10.;
constexpr double TEMPERATURE_SCALING_FACTOR = 10.;
constexpr double PRESSURE_SCALING_FACTOR = 10.;

}

/**
 * @brief Parse the timestamp of an ISD record
 *
 * @param token The 12 characters of the datetime field, formatted as
 * YYYYMMDDHHMM in UTC
 * @return The corresponding UTC time point
 * @throw FormatError If the token is not made of 12 digits or does not
 * represent a valid date and time (2018-09-31 is rejected, not clamped)
 */
date::sys_seconds parseDatetime(std::string_view token);

/**
 * @brief Decode one line of an ISD file
 *
 * Only the control and mandatory data sections are decoded, the additional
 * data section (after the 105th character) is ignored.
 *
 * @param line A raw ISD line, without its line terminator
 * @return The decoded record
 * @throw FormatError If the line does not conform to the ISD layout
 */
IsdRecord parseLine(std::string_view line);

}

#endif /* ISD_RECORD_PARSER_H */
