/**
 * @file time_offseter.cpp
 * @brief Implementation of the TimeOffseter class
 * @author Laurent Georget
 * @date 2017-10-13
 */
/*
 * Copyright (C) 2017 SAS Météo Concept <contact@meteo-concept.fr>
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
#include <sstream>
#include <iomanip>
#include <stdexcept>

#include <date/date.h>
#include <date/tz.h>

#include "errors.h"
#include "time_offseter.h"

namespace meteoisd
{
	namespace chrono = std::chrono;

	TimeOffseter::TimeOffseter() :
		_byTimezone{false},
		_name{"UTC"}
	{
		_timezoneInfo.timeOffset = chrono::minutes(0);
	}

	TimeOffseter TimeOffseter::getTimeOffseterFor(const std::string& tz)
	{
		TimeOffseter t;
		if (tz == "UTC" || tz == "Z")
			return t;

		t._byTimezone = true;
		t._name = tz;
		try {
			t._timezoneInfo.timezone = date::locate_zone(tz);
		} catch (const std::runtime_error& e) {
			throw ConfigurationError{"Unknown timezone '" + tz + "': " + e.what()};
		}
		return t;
	}

	chrono::seconds TimeOffseter::getOffset(date::sys_seconds time) const
	{
		if (_byTimezone)
			return _timezoneInfo.timezone->get_info(time).offset;
		else
			return _timezoneInfo.timeOffset;
	}

	std::string TimeOffseter::format(date::sys_seconds time) const
	{
		chrono::seconds offset = getOffset(time);
		chrono::minutes absOffset = date::floor<chrono::minutes>(offset < chrono::seconds{0} ? -offset : offset);

		std::ostringstream os;
		os << date::format("%F %T", time + offset)
		   << (offset < chrono::seconds{0} ? '-' : '+')
		   << std::setfill('0') << std::setw(2) << absOffset.count() / 60
		   << std::setfill('0') << std::setw(2) << absOffset.count() % 60;
		return os.str();
	}
}
