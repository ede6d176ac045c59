/**
 * @file time_series.cpp
 * @brief Implementation of the TimeSeries class
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

#include <algorithm>
#include <iterator>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "time_series.h"

namespace meteoisd
{

TimeSeries::TimeSeries(std::vector<std::string> columns) :
	_columns{std::move(columns)}
{
}

void TimeSeries::append(date::sys_seconds time, Row row)
{
	if (row.size() != _columns.size())
		throw std::invalid_argument{"Row has " + std::to_string(row.size()) + " values, expected " +
			std::to_string(_columns.size())};

	_index.push_back(time);
	_rows.push_back(std::move(row));
}

const TimeSeries::Value& TimeSeries::get(std::size_t row, const std::string& column) const
{
	return _rows.at(row)[getColumnIndex(column)];
}

std::size_t TimeSeries::getColumnIndex(const std::string& column) const
{
	auto it = std::find(_columns.cbegin(), _columns.cend(), column);
	if (it == _columns.cend())
		throw std::out_of_range{"No column " + column + " in time series"};
	return std::distance(_columns.cbegin(), it);
}

bool TimeSeries::isSorted() const
{
	return std::is_sorted(_index.cbegin(), _index.cend());
}

void TimeSeries::sortByTime()
{
	if (isSorted())
		return;

	std::vector<std::size_t> order(_index.size());
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(), [this](std::size_t i, std::size_t j) {
		return _index[i] < _index[j];
	});

	std::vector<date::sys_seconds> index;
	std::vector<Row> rows;
	index.reserve(order.size());
	rows.reserve(order.size());
	for (std::size_t i : order) {
		index.push_back(_index[i]);
		rows.push_back(std::move(_rows[i]));
	}
	_index = std::move(index);
	_rows = std::move(rows);
}

TimeSeries TimeSeries::shifted(chrono::seconds offset) const
{
	TimeSeries result{*this};
	for (auto& time : result._index)
		time += offset;
	return result;
}

}
