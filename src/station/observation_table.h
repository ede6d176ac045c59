/**
 * @file observation_table.h
 * @brief Definition of the ObservationTable class
 * @author Laurent Georget
 * @date 2026-03-04
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

#ifndef OBSERVATION_TABLE_H
#define OBSERVATION_TABLE_H

#include <cstddef>
#include <string>
#include <vector>
#include <variant>
#include <functional>
#include <ostream>
#include <utility>

#include <date/date.h>

#include "../time_offseter.h"
#include "../rollup/time_series.h"

namespace meteoisd
{

/**
 * @brief A value in an observation table, std::monostate stands for a
 * missing value
 */
using Cell = std::variant<std::monostate, long, double, std::string>;

/**
 * @brief The observations of a station, one row per timestamp and one
 * column per field
 *
 * Timestamps are stored in UTC, the display timezone is only used when the
 * table is written out.
 */
class ObservationTable
{
public:
	using Row = std::vector<Cell>;

	ObservationTable() = default;
	explicit ObservationTable(std::vector<std::string> columns);

	/**
	 * @brief Build a table from a numeric time series
	 */
	static ObservationTable fromTimeSeries(const TimeSeries& series);

	/**
	 * @brief Convert the table to a numeric time series
	 * @throw std::invalid_argument If a column contains text
	 */
	TimeSeries toTimeSeries() const;

	/**
	 * @throw std::invalid_argument If the row does not have one cell per column
	 */
	void append(date::sys_seconds time, Row row);

	/**
	 * @brief Remove all the columns for which a predicate holds
	 */
	void dropColumns(const std::function<bool(const std::string&)>& predicate);

	inline std::size_t size() const
	{
		return _index.size();
	}

	inline bool empty() const
	{
		return _index.empty();
	}

	inline std::size_t columnCount() const
	{
		return _columns.size();
	}

	inline const std::vector<std::string>& getColumnNames() const
	{
		return _columns;
	}

	inline date::sys_seconds getTime(std::size_t row) const
	{
		return _index[row];
	}

	inline const Row& getRow(std::size_t row) const
	{
		return _rows[row];
	}

	inline const Cell& get(std::size_t row, std::size_t column) const
	{
		return _rows[row][column];
	}

	/**
	 * @throw std::out_of_range If the column does not exist
	 */
	const Cell& get(std::size_t row, const std::string& column) const;

	bool hasColumn(const std::string& column) const;

	/**
	 * @throw std::out_of_range If the column does not exist
	 */
	std::size_t getColumnIndex(const std::string& column) const;

	inline void setDisplayTimezone(TimeOffseter tz)
	{
		_tz = std::move(tz);
	}

	inline const TimeOffseter& getDisplayTimezone() const
	{
		return _tz;
	}

	/**
	 * @brief Output the table as CSV, with a header line and the
	 * timestamps in the first column
	 */
	void writeCsv(std::ostream& out) const;

	/**
	 * @brief Output the table as a JSON array of objects, missing values
	 * are left out
	 */
	void writeJson(std::ostream& out) const;

private:
	std::vector<std::string> _columns;
	std::vector<date::sys_seconds> _index;
	std::vector<Row> _rows;
	TimeOffseter _tz;
};

/**
 * @brief Format a cell for display, missing values give an empty string
 */
std::string toString(const Cell& cell);

}

#endif /* OBSERVATION_TABLE_H */
