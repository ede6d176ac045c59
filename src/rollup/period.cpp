/**
 * @file period.cpp
 * @brief Implementation of the Period class
 * @author Laurent Georget
 * @date 2026-02-23
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
#include <map>
#include <regex>
#include <stdexcept>

#include <date/date.h>

#include "../errors.h"
#include "period.h"

namespace meteoisd
{

namespace
{
	const std::map<std::string, Period::Unit> units = {
		{"s",       Period::Unit::SECOND},
		{"S",       Period::Unit::SECOND},
		{"sec",     Period::Unit::SECOND},
		{"second",  Period::Unit::SECOND},
		{"seconds", Period::Unit::SECOND},
		{"min",     Period::Unit::MINUTE},
		{"T",       Period::Unit::MINUTE},
		{"minute",  Period::Unit::MINUTE},
		{"minutes", Period::Unit::MINUTE},
		{"h",       Period::Unit::HOUR},
		{"H",       Period::Unit::HOUR},
		{"hour",    Period::Unit::HOUR},
		{"hours",   Period::Unit::HOUR},
		{"D",       Period::Unit::DAY},
		{"d",       Period::Unit::DAY},
		{"day",     Period::Unit::DAY},
		{"days",    Period::Unit::DAY},
		{"MS",      Period::Unit::MONTH},
		{"month",   Period::Unit::MONTH},
		{"months",  Period::Unit::MONTH},
		{"YS",      Period::Unit::YEAR},
		{"AS",      Period::Unit::YEAR},
		{"year",    Period::Unit::YEAR},
		{"years",   Period::Unit::YEAR}
	};
}

Period::Period(int count, Unit unit) :
	_count{count},
	_unit{unit}
{
	if (count <= 0)
		throw ConfigurationError{"A period must span a positive number of units"};
}

Period Period::parse(const std::string& spec)
{
	const std::regex periodRegex{"^\\s*(\\d*)\\s*([A-Za-z]+)\\s*$"};

	std::smatch match;
	if (!std::regex_match(spec, match, periodRegex))
		throw ConfigurationError{"Invalid period '" + spec + "'"};

	auto unitIt = units.find(match[2].str());
	if (unitIt == units.end())
		throw ConfigurationError{"Unknown period unit '" + match[2].str() + "'"};

	int count = 1;
	if (match[1].length()) {
		try {
			count = std::stoi(match[1].str());
		} catch (const std::out_of_range&) {
			throw ConfigurationError{"Period '" + spec + "' is too long"};
		}
	}

	return Period{count, unitIt->second};
}

bool Period::isFixed() const
{
	return _unit != Unit::MONTH && _unit != Unit::YEAR;
}

chrono::seconds Period::getDuration() const
{
	switch (_unit) {
		case Unit::SECOND:
			return chrono::seconds{_count};
		case Unit::MINUTE:
			return chrono::minutes{_count};
		case Unit::HOUR:
			return chrono::hours{_count};
		case Unit::DAY:
			return date::days{_count};
		default:
			throw ConfigurationError{"Period " + toString() + " has no fixed duration"};
	}
}

date::sys_seconds Period::firstEdge(date::sys_seconds first, bool closedRight) const
{
	date::sys_seconds edge;
	if (isFixed()) {
		chrono::seconds duration = getDuration();
		date::sys_seconds origin = date::floor<date::days>(first);
		edge = origin + ((first - origin) / duration) * duration;
	} else {
		date::year_month_day ymd{date::floor<date::days>(first)};
		if (_unit == Unit::MONTH)
			edge = date::sys_days{ymd.year() / ymd.month() / 1};
		else
			edge = date::sys_days{ymd.year() / 1 / 1};
	}

	// a sample sitting exactly on an edge belongs to the bucket on its left
	// when buckets are closed on the right
	if (closedRight && edge == first)
		edge = previous(edge);
	return edge;
}

date::sys_seconds Period::next(date::sys_seconds edge) const
{
	if (isFixed())
		return edge + getDuration();

	date::year_month_day ymd{date::floor<date::days>(edge)};
	date::year_month ym{ymd.year(), ymd.month()};
	if (_unit == Unit::MONTH)
		ym += date::months{_count};
	else
		ym += date::years{_count};
	return date::sys_days{ym / 1};
}

date::sys_seconds Period::previous(date::sys_seconds edge) const
{
	if (isFixed())
		return edge - getDuration();

	date::year_month_day ymd{date::floor<date::days>(edge)};
	date::year_month ym{ymd.year(), ymd.month()};
	if (_unit == Unit::MONTH)
		ym -= date::months{_count};
	else
		ym -= date::years{_count};
	return date::sys_days{ym / 1};
}

std::string Period::toString() const
{
	std::string unit;
	switch (_unit) {
		case Unit::SECOND:
			unit = "s";
			break;
		case Unit::MINUTE:
			unit = "min";
			break;
		case Unit::HOUR:
			unit = "h";
			break;
		case Unit::DAY:
			unit = "D";
			break;
		case Unit::MONTH:
			unit = "MS";
			break;
		case Unit::YEAR:
			unit = "YS";
			break;
	}
	return std::to_string(_count) + unit;
}

}
