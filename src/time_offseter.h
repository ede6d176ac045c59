/**
 * @file time_offseter.h
 * @brief Definition of the TimeOffseter class
 * @author Laurent Georget
 * @date 2017-10-11
 */
/*
 * Copyright (C) 2017  SAS Météo Concept <contact@meteo-concept.fr>
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

#ifndef TIME_OFFSETER_H
#define TIME_OFFSETER_H

#include <chrono>
#include <string>

#include <date/date.h>
#include <date/tz.h>

namespace meteoisd
{

namespace chrono = std::chrono;

/**
 * @brief Perform conversion between UTC and the time displayed to the user
 *
 * ISD timestamps are always in UTC and all computations are done in UTC, the
 * display time is only used when the observations are output. It is given
 * either by an IANA timezone, in which case the offset to UTC depends on the
 * date (DST), or by a fixed offset (UTC itself, mostly).
 */
class TimeOffseter
{
public:
	/**
	 * @brief Build a \a TimeOffseter displaying times in UTC
	 */
	TimeOffseter();

	/**
	 * @brief Build a \a TimeOffseter for a timezone
	 *
	 * @param tz "UTC" or the name of a timezone in the IANA database, such
	 * as "America/Denver"
	 * @throw ConfigurationError If the timezone is unknown
	 */
	static TimeOffseter getTimeOffseterFor(const std::string& tz);

	/**
	 * @brief Get the offset to UTC in effect at some point in time
	 */
	chrono::seconds getOffset(date::sys_seconds time) const;

	/**
	 * @brief Format a timestamp in display time, as "2018-09-21 19:15:00-0600"
	 */
	std::string format(date::sys_seconds time) const;

	inline const std::string& getName() const
	{
		return _name;
	}

private:
	/**
	 * @brief Describe how the \a TimeOffseter should perform time
	 * conversions
	 */
	union
	{
		const date::time_zone* timezone; /*!< The display time is given by a IANA timezone */
		chrono::minutes timeOffset; /*!< The display time is given by a static offset to UTC */
	} _timezoneInfo;
	/**
	 * @brief Tell whether \a _timezoneInfo.timezone or \a _timezoneInfo.timeOffset should be
	 * taken into account
	 */
	bool _byTimezone;

	std::string _name;
};

}

#endif /* TIME_OFFSETER_H */
