/**
 * @file rollup.cpp
 * @brief Implementation of the time series aggregation functions
 * @author Laurent Georget
 * @date 2026-02-24
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

#include <cstddef>
#include <chrono>
#include <string>
#include <vector>
#include <optional>
#include <map>
#include <utility>

#include <date/date.h>

#include "../errors.h"
#include "time_series.h"
#include "period.h"
#include "rollup.h"

namespace meteoisd
{

namespace
{
	enum class Aggregation
	{
		MEAN, FIRST
	};

	constexpr int MAX_INTERPOLATION_GAP = 60;

	const std::map<std::string, RollupPolicy> policies = {
		{"starting", RollupPolicy::STARTING},
		{"ending",   RollupPolicy::ENDING},
		{"midpoint", RollupPolicy::MIDPOINT},
		{"instant",  RollupPolicy::INSTANT}
	};

	TimeSeries sorted(const TimeSeries& data)
	{
		TimeSeries result{data};
		result.sortByTime();
		return result;
	}

	TimeSeries::Row aggregate(const TimeSeries& data, std::size_t begin, std::size_t end, Aggregation aggregation)
	{
		TimeSeries::Row row(data.columnCount());
		for (std::size_t c = 0 ; c < data.columnCount() ; c++) {
			double sum = 0.;
			int count = 0;
			for (std::size_t r = begin ; r < end ; r++) {
				const auto& value = data.get(r, c);
				if (!value)
					continue;
				if (aggregation == Aggregation::FIRST) {
					row[c] = value;
					break;
				}
				sum += *value;
				count++;
			}
			if (aggregation == Aggregation::MEAN && count > 0)
				row[c] = sum / count;
		}
		return row;
	}

	/**
	 * data must be sorted
	 */
	TimeSeries resample(const TimeSeries& data, const Period& period, bool closedRight, Aggregation aggregation)
	{
		TimeSeries result{data.getColumnNames()};
		if (data.empty())
			return result;

		date::sys_seconds edge = period.firstEdge(data.getTime(0), closedRight);
		std::size_t i = 0;
		while (i < data.size()) {
			date::sys_seconds next = period.next(edge);
			std::size_t begin = i;
			while (i < data.size() && (data.getTime(i) < next || (closedRight && data.getTime(i) == next)))
				i++;
			result.append(closedRight ? next : edge, aggregate(data, begin, i, aggregation));
			edge = next;
		}
		return result;
	}

	void interpolate(TimeSeries::Row& column)
	{
		const int n = column.size();
		std::vector<int> previousValid(n, -1);
		std::vector<int> nextValid(n, -1);
		for (int i = 0, last = -1 ; i < n ; i++) {
			if (column[i])
				last = i;
			previousValid[i] = last;
		}
		for (int i = n - 1, last = -1 ; i >= 0 ; i--) {
			if (column[i])
				last = i;
			nextValid[i] = last;
		}

		TimeSeries::Row filled{column};
		for (int i = 0 ; i < n ; i++) {
			if (column[i])
				continue;
			int p = previousValid[i];
			int q = nextValid[i];
			bool closeToPrevious = p >= 0 && i - p <= MAX_INTERPOLATION_GAP;
			bool closeToNext = q >= 0 && q - i <= MAX_INTERPOLATION_GAP;
			if (!closeToPrevious && !closeToNext)
				continue;

			if (p >= 0 && q >= 0)
				filled[i] = *column[p] + (*column[q] - *column[p]) * (i - p) / (q - p);
			else if (p >= 0)
				filled[i] = column[p];
			else
				filled[i] = column[q];
		}
		column = std::move(filled);
	}

	TimeSeries prepare(const TimeSeries& data, bool upsampleFirst)
	{
		return upsampleFirst ? upsample(data) : sorted(data);
	}
}

void checkMidpointPeriod(const Period& period)
{
	if (!period.isFixed())
		throw ConfigurationError{"The midpoint rollup needs a period of fixed duration, " +
			period.toString() + " is not"};
	if (period.getDuration().count() % 2 != 0)
		throw ConfigurationError{"The midpoint rollup needs a period of an even number of seconds, " +
			period.toString() + " is not"};
}

RollupPolicy parseRollupPolicy(const std::string& name)
{
	auto it = policies.find(name);
	if (it == policies.end())
		throw ConfigurationError{"Unknown rollup policy '" + name + "', expected starting, ending, midpoint or instant"};
	return it->second;
}

std::string toString(RollupPolicy policy)
{
	for (const auto& p : policies) {
		if (p.second == policy)
			return p.first;
	}
	return "";
}

TimeSeries upsample(const TimeSeries& data)
{
	TimeSeries minutes = resample(sorted(data), Period::minutes(1), false, Aggregation::MEAN);

	std::vector<TimeSeries::Row> columns(minutes.columnCount(), TimeSeries::Row(minutes.size()));
	for (std::size_t r = 0 ; r < minutes.size() ; r++) {
		for (std::size_t c = 0 ; c < minutes.columnCount() ; c++)
			columns[c][r] = minutes.get(r, c);
	}
	for (auto& column : columns)
		interpolate(column);

	TimeSeries result{minutes.getColumnNames()};
	for (std::size_t r = 0 ; r < minutes.size() ; r++) {
		TimeSeries::Row row(minutes.columnCount());
		for (std::size_t c = 0 ; c < minutes.columnCount() ; c++)
			row[c] = columns[c][r];
		result.append(minutes.getTime(r), std::move(row));
	}
	return result;
}

TimeSeries rollupStarting(const TimeSeries& data, const Period& period, bool upsampleFirst)
{
	return resample(prepare(data, upsampleFirst), period, false, Aggregation::MEAN);
}

TimeSeries rollupEnding(const TimeSeries& data, const Period& period, bool upsampleFirst)
{
	return resample(prepare(data, upsampleFirst), period, true, Aggregation::MEAN);
}

TimeSeries rollupMidpoint(const TimeSeries& data, const Period& period, bool upsampleFirst)
{
	checkMidpointPeriod(period);

	chrono::seconds halfPeriod = period.getDuration() / 2;
	return resample(prepare(data, upsampleFirst).shifted(halfPeriod), period, false, Aggregation::MEAN);
}

TimeSeries rollupInstant(const TimeSeries& data, const Period& period, bool upsampleFirst)
{
	return resample(prepare(data, upsampleFirst), period, false, Aggregation::FIRST);
}

TimeSeries rollup(const TimeSeries& data, const Period& period, RollupPolicy policy, bool upsampleFirst)
{
	switch (policy) {
		case RollupPolicy::STARTING:
			return rollupStarting(data, period, upsampleFirst);
		case RollupPolicy::ENDING:
			return rollupEnding(data, period, upsampleFirst);
		case RollupPolicy::MIDPOINT:
			return rollupMidpoint(data, period, upsampleFirst);
		case RollupPolicy::INSTANT:
			return rollupInstant(data, period, upsampleFirst);
	}
	throw ConfigurationError{"Unknown rollup policy"};
}

}
