/**
 * @file observation_table.cpp
 * @brief Implementation of the ObservationTable class
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

#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "observation_table.h"

namespace meteoisd
{

namespace pt = boost::property_tree;

namespace
{
	struct CellFormatter
	{
		std::string operator()(std::monostate) const
		{
			return {};
		}

		std::string operator()(long value) const
		{
			return std::to_string(value);
		}

		std::string operator()(double value) const
		{
			std::ostringstream os;
			os << std::setprecision(10) << value;
			return os.str();
		}

		std::string operator()(const std::string& value) const
		{
			return value;
		}
	};

	std::string escapeCsv(const std::string& value)
	{
		if (value.find_first_of(",\"\n") == std::string::npos)
			return value;

		std::string escaped = "\"";
		for (char c : value) {
			if (c == '"')
				escaped += '"';
			escaped += c;
		}
		escaped += '"';
		return escaped;
	}
}

std::string toString(const Cell& cell)
{
	return std::visit(CellFormatter{}, cell);
}

ObservationTable::ObservationTable(std::vector<std::string> columns) :
	_columns{std::move(columns)}
{
}

ObservationTable ObservationTable::fromTimeSeries(const TimeSeries& series)
{
	ObservationTable table{series.getColumnNames()};
	for (std::size_t r = 0 ; r < series.size() ; r++) {
		Row row;
		row.reserve(series.columnCount());
		for (const auto& value : series.getRow(r)) {
			if (value)
				row.emplace_back(*value);
			else
				row.emplace_back(std::monostate{});
		}
		table.append(series.getTime(r), std::move(row));
	}
	return table;
}

TimeSeries ObservationTable::toTimeSeries() const
{
	TimeSeries series{_columns};
	for (std::size_t r = 0 ; r < _rows.size() ; r++) {
		TimeSeries::Row values(_columns.size());
		for (std::size_t c = 0 ; c < _columns.size() ; c++) {
			const Cell& cell = _rows[r][c];
			if (std::holds_alternative<long>(cell))
				values[c] = static_cast<double>(std::get<long>(cell));
			else if (std::holds_alternative<double>(cell))
				values[c] = std::get<double>(cell);
			else if (std::holds_alternative<std::string>(cell))
				throw std::invalid_argument{"Column " + _columns[c] + " is not numeric"};
		}
		series.append(_index[r], std::move(values));
	}
	return series;
}

void ObservationTable::append(date::sys_seconds time, Row row)
{
	if (row.size() != _columns.size())
		throw std::invalid_argument{"Row has " + std::to_string(row.size()) + " cells, expected " +
			std::to_string(_columns.size())};
	_index.push_back(time);
	_rows.push_back(std::move(row));
}

void ObservationTable::dropColumns(const std::function<bool(const std::string&)>& predicate)
{
	std::vector<std::size_t> kept;
	for (std::size_t c = 0 ; c < _columns.size() ; c++) {
		if (!predicate(_columns[c]))
			kept.push_back(c);
	}
	if (kept.size() == _columns.size())
		return;

	std::vector<std::string> columns;
	for (std::size_t c : kept)
		columns.push_back(std::move(_columns[c]));
	_columns = std::move(columns);

	for (auto& row : _rows) {
		Row cells;
		cells.reserve(kept.size());
		for (std::size_t c : kept)
			cells.push_back(std::move(row[c]));
		row = std::move(cells);
	}
}

const Cell& ObservationTable::get(std::size_t row, const std::string& column) const
{
	return _rows.at(row)[getColumnIndex(column)];
}

bool ObservationTable::hasColumn(const std::string& column) const
{
	return std::find(_columns.cbegin(), _columns.cend(), column) != _columns.cend();
}

std::size_t ObservationTable::getColumnIndex(const std::string& column) const
{
	auto it = std::find(_columns.cbegin(), _columns.cend(), column);
	if (it == _columns.cend())
		throw std::out_of_range{"No column " + column + " in table"};
	return std::distance(_columns.cbegin(), it);
}

void ObservationTable::writeCsv(std::ostream& out) const
{
	out << "datetime";
	for (const std::string& column : _columns)
		out << "," << escapeCsv(column);
	out << "\n";

	for (std::size_t r = 0 ; r < _rows.size() ; r++) {
		out << _tz.format(_index[r]);
		for (const Cell& cell : _rows[r])
			out << "," << escapeCsv(toString(cell));
		out << "\n";
	}
}

void ObservationTable::writeJson(std::ostream& out) const
{
	pt::ptree root;
	for (std::size_t r = 0 ; r < _rows.size() ; r++) {
		pt::ptree object;
		object.put("datetime", _tz.format(_index[r]));
		for (std::size_t c = 0 ; c < _columns.size() ; c++) {
			const Cell& cell = _rows[r][c];
			if (std::holds_alternative<std::monostate>(cell))
				continue;
			// column names contain dots, which are path separators by default
			object.put(pt::ptree::path_type{_columns[c], '/'}, toString(cell));
		}
		root.push_back(std::make_pair("", object));
	}
	pt::write_json(out, root);
}

}
