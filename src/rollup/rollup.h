/**
 * @file rollup.h
 * @brief Definition of the time series aggregation functions
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

#ifndef ROLLUP_H
#define ROLLUP_H

#include <string>

#include "time_series.h"
#include "period.h"

namespace meteoisd
{

/**
 * @brief The way the samples of a bucket are combined and the bucket labelled
 */
enum class RollupPolicy
{
	STARTING, //!< mean over [start, start + period), labelled with start
	ENDING,   //!< mean over (start, start + period], labelled with start + period
	MIDPOINT, //!< mean over [start - period/2, start + period/2), labelled with start
	INSTANT   //!< first value over [start, start + period), labelled with start
};

/**
 * @brief Get the rollup policy from its name ("starting", "ending",
 * "midpoint" or "instant")
 * @throw ConfigurationError If the name is unknown
 */
RollupPolicy parseRollupPolicy(const std::string& name);

std::string toString(RollupPolicy policy);

/**
 * @brief Resample a series to one row per minute and fill the holes
 *
 * The values of each minute are averaged, then each column is linearly
 * interpolated. A hole is filled only if it is at most 60 minutes away
 * from a valid value, holes before the first valid value (after the last
 * one) are filled with that value.
 */
TimeSeries upsample(const TimeSeries& data);

TimeSeries rollupStarting(const TimeSeries& data, const Period& period, bool upsampleFirst = true);
TimeSeries rollupEnding(const TimeSeries& data, const Period& period, bool upsampleFirst = true);

/**
 * @brief Check that a period can be used for a midpoint rollup: the buckets
 * are shifted by half the period, which must be a whole number of seconds
 * @throw ConfigurationError If the period has no fixed duration or an odd
 * number of seconds
 */
void checkMidpointPeriod(const Period& period);

/**
 * @throw ConfigurationError If the period is not suitable, see checkMidpointPeriod()
 */
TimeSeries rollupMidpoint(const TimeSeries& data, const Period& period, bool upsampleFirst = true);

TimeSeries rollupInstant(const TimeSeries& data, const Period& period, bool upsampleFirst = true);

/**
 * @brief Aggregate a series over a period according to a policy
 *
 * The input needs not be sorted, it is sorted by time (keeping the order of
 * simultaneous rows) before bucketing. Every bucket from the first sample to
 * the last is present in the output, buckets with no value give an absent
 * value.
 */
TimeSeries rollup(const TimeSeries& data, const Period& period, RollupPolicy policy, bool upsampleFirst = true);

}

#endif /* ROLLUP_H */
