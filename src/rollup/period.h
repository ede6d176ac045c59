/**
 * @file period.h
 * @brief Definition of the Period class
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

#ifndef PERIOD_H
#define PERIOD_H

#include <chrono>
#include <string>

#include <date/date.h>

namespace meteoisd
{

namespace chrono = std::chrono;

/**
 * @brief The length of the buckets of a rollup
 *
 * A period is a number of seconds, minutes, hours or days, which are all
 * fixed durations, or a number of months or years, whose length depends on
 * the calendar.
 *
 * The buckets of a fixed period are aligned on midnight UTC of the day of the
 * first sample, the buckets of a calendar period on the first day of the
 * month (or year) of the first sample.
 */
class Period
{
public:
	enum class Unit
	{
		SECOND, MINUTE, HOUR, DAY, MONTH, YEAR
	};

	Period(int count, Unit unit);

	/**
	 * @brief Parse a period such as "h", "15min", "1 hour", "30 minutes" or "MS"
	 *
	 * @param spec The textual representation of the period, an optional
	 * positive count followed by a unit
	 * @return The period
	 * @throw ConfigurationError If the unit is unknown or the count is not
	 * positive
	 */
	static Period parse(const std::string& spec);

	inline static Period minutes(int count)
	{
		return Period{count, Unit::MINUTE};
	}

	inline static Period hours(int count)
	{
		return Period{count, Unit::HOUR};
	}

	/**
	 * @brief Tell whether all the buckets of this period have the same length
	 */
	bool isFixed() const;

	/**
	 * @brief Get the length of the period
	 * @throw ConfigurationError If the period is not fixed
	 */
	chrono::seconds getDuration() const;

	/**
	 * @brief Compute the first bucket edge for a series
	 *
	 * @param first The time of the earliest sample
	 * @param closedRight Whether the buckets include their right edge
	 * (and exclude their left edge) instead of the converse
	 * @return The left edge of the bucket which contains \a first
	 */
	date::sys_seconds firstEdge(date::sys_seconds first, bool closedRight) const;

	/**
	 * @brief Compute the edge following a bucket edge
	 */
	date::sys_seconds next(date::sys_seconds edge) const;

	std::string toString() const;

	inline int getCount() const
	{
		return _count;
	}

	inline Unit getUnit() const
	{
		return _unit;
	}

private:
	int _count;
	Unit _unit;

	date::sys_seconds previous(date::sys_seconds edge) const;
};

}

#endif /* PERIOD_H */
