/**
 * @file time_series.h
 * @brief Definition of the TimeSeries class
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

#ifndef TIME_SERIES_H
#define TIME_SERIES_H

#include <cstddef>
#include <chrono>
#include <string>
#include <vector>
#include <optional>

#include <date/date.h>

namespace meteoisd
{

namespace chrono = std::chrono;

/**
 * @brief A table of numeric values indexed by time
 *
 * Each row has one value per column, any of which can be missing. The index
 * is not required to be sorted nor unique.
 */
class TimeSeries
{
public:
	using Value = std::optional<double>;
	using Row = std::vector<Value>;

	TimeSeries() = default;
	explicit TimeSeries(std::vector<std::string> columns);

	/**
	 * @brief Add a row at the end of the series
	 * @throw std::invalid_argument If the row does not have one value per column
	 */
	void append(date::sys_seconds time, Row row);

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

	inline const Value& get(std::size_t row, std::size_t column) const
	{
		return _rows[row][column];
	}

	/**
	 * @brief Get a value by the name of its column
	 * @throw std::out_of_range If the column does not exist
	 */
	const Value& get(std::size_t row, const std::string& column) const;

	/**
	 * @brief Get the position of a column
	 * @throw std::out_of_range If the column does not exist
	 */
	std::size_t getColumnIndex(const std::string& column) const;

	bool isSorted() const;

	/**
	 * @brief Sort the rows by time, rows with the same time keep their
	 * relative order
	 */
	void sortByTime();

	/**
	 * @brief Build a copy of the series with all the times moved by an offset
	 */
	TimeSeries shifted(chrono::seconds offset) const;

private:
	std::vector<std::string> _columns;
	std::vector<date::sys_seconds> _index;
	std::vector<Row> _rows;
};

}

#endif /* TIME_SERIES_H */
