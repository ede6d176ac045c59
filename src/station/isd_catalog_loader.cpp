/**
 * @file isd_catalog_loader.cpp
 * @brief Implementation of the IsdCatalogLoader class
 * @author Laurent Georget
 * @date 2026-03-03
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

#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <array>
#include <utility>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <fstream>
#include <iterator>
#include <memory>
#include <filesystem>

#include <boost/tokenizer.hpp>
#include <systemd/sd-daemon.h>
#include <date/date.h>

#include "../errors.h"
#include "../transport/transport.h"
#include "in_memory_metadata_store.h"
#include "isd_catalog_loader.h"

namespace meteoisd
{

namespace chrono = std::chrono;
namespace fs = std::filesystem;

namespace
{
	using CsvTokenizer = boost::tokenizer<boost::escaped_list_separator<char>>;

	// explicit mapping, the order of the columns in the file is not relied upon
	const std::array<std::pair<const char*, unsigned int>, 12> MONTHS = {{
		{"jan", 1}, {"feb", 2}, {"mar", 3}, {"apr", 4}, {"may", 5}, {"jun", 6},
		{"jul", 7}, {"aug", 8}, {"sep", 9}, {"oct", 10}, {"nov", 11}, {"dec", 12}
	}};

	std::vector<std::string> splitCsvLine(const std::string& line)
	{
		CsvTokenizer tokenizer{line};
		return std::vector<std::string>{tokenizer.begin(), tokenizer.end()};
	}

	std::string lowercase(std::string s)
	{
		std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
		return s;
	}

	/**
	 * Reads a CSV file with a header, columns are looked up by their name,
	 * case insensitively
	 */
	class CsvReader
	{
	public:
		CsvReader(std::istream& input, const std::string& name) :
			_input{input},
			_name{name}
		{
			std::string header;
			if (!nextLine(header))
				throw FormatError{FormatError{"file is empty"}, _name, 1};
			std::vector<std::string> columns = split(header);
			for (std::size_t i = 0 ; i < columns.size() ; i++)
				_columns[lowercase(columns[i])] = i;
		}

		std::size_t column(const std::string& name) const
		{
			auto it = _columns.find(name);
			if (it == _columns.end())
				throw FormatError{FormatError{"missing column " + name}, _name, 1};
			return it->second;
		}

		bool next(std::vector<std::string>& row)
		{
			std::string line;
			do {
				if (!nextLine(line))
					return false;
			} while (line.empty());

			row = split(line);
			if (row.size() < _columns.size())
				fail("expected " + std::to_string(_columns.size()) + " values, got " + std::to_string(row.size()));
			return true;
		}

		[[noreturn]] void fail(const std::string& reason) const
		{
			throw FormatError{FormatError{reason}, _name, _lineNumber};
		}

	private:
		std::istream& _input;
		const std::string& _name;
		std::map<std::string, std::size_t> _columns;
		std::size_t _lineNumber = 0;

		bool nextLine(std::string& line)
		{
			if (!std::getline(_input, line))
				return false;
			_lineNumber++;
			if (!line.empty() && line.back() == '\r')
				line.pop_back();
			return true;
		}

		std::vector<std::string> split(const std::string& line) const
		{
			try {
				return splitCsvLine(line);
			} catch (const boost::escaped_list_error& e) {
				fail(std::string{"malformed CSV: "} + e.what());
			}
		}
	};

	/**
	 * NOAA writes coordinates and elevations with an explicit sign, and
	 * zero when unknown
	 */
	std::optional<double> parseCoordinate(const std::string& value)
	{
		if (value.empty())
			return std::nullopt;
		std::size_t pos;
		double v = std::stod(value, &pos);
		if (pos != value.length())
			throw std::invalid_argument{value};
		if (v == 0.)
			return std::nullopt;
		return v;
	}

	int parseInteger(const std::string& value)
	{
		std::size_t pos;
		int v = std::stoi(value, &pos);
		if (pos != value.length())
			throw std::invalid_argument{value};
		return v;
	}

	struct HistoryRow
	{
		StationMetadata station;
		std::string end;
	};
}

IsdCatalogLoader::IsdCatalogLoader(InMemoryMetadataStore& store, date::year_month_day today) :
	_store{store},
	_today{today}
{
}

std::size_t IsdCatalogLoader::download(Transport& transport, const std::string& filename, const std::string& destination)
{
	std::unique_ptr<std::istream> input = transport.open(filename);
	std::string content{std::istreambuf_iterator<char>{*input}, std::istreambuf_iterator<char>{}};

	fs::path path{destination};
	if (path.has_parent_path())
		fs::create_directories(path.parent_path());

	fs::path temporary{destination + ".part"};
	std::ofstream output{temporary, std::ios::out | std::ios::binary | std::ios::trunc};
	if (!output)
		throw std::runtime_error{"Cannot write to " + temporary.string()};
	output.write(content.data(), content.size());
	output.close();
	if (!output)
		throw std::runtime_error{"Error while writing " + temporary.string()};
	fs::rename(temporary, path);

	std::cerr << SD_NOTICE << "[ISD] management: " << "Saved " << filename << " to " << destination
		  << " (" << content.size() << " bytes)" << std::endl;
	return content.size();
}

std::size_t IsdCatalogLoader::loadHistory(std::istream& input, const std::string& name)
{
	CsvReader reader{input, name};
	const std::size_t usafCol = reader.column("usaf");
	const std::size_t wbanCol = reader.column("wban");
	const std::size_t nameCol = reader.column("station name");
	const std::size_t countryCol = reader.column("ctry");
	const std::size_t stateCol = reader.column("state");
	const std::size_t icaoCol = reader.column("icao");
	const std::size_t latCol = reader.column("lat");
	const std::size_t lonCol = reader.column("lon");
	const std::size_t elevCol = reader.column("elev(m)");
	const std::size_t endCol = reader.column("end");

	std::map<std::string, HistoryRow> mostRecent;
	std::vector<std::string> row;
	while (reader.next(row)) {
		const std::string& usaf = row[usafCol];
		auto it = mostRecent.find(usaf);
		if (it == mostRecent.end())
			it = mostRecent.emplace(usaf, HistoryRow{}).first;
		HistoryRow& current = it->second;
		current.station.wbanIds.push_back(row[wbanCol]);

		if (!current.station.usafId.empty() && row[endCol] <= current.end)
			continue;

		StationMetadata& s = current.station;
		s.usafId = usaf;
		s.recentWbanId = row[wbanCol];
		s.name = row[nameCol];
		s.country = row[countryCol];
		s.state = row[stateCol];
		s.icaoCode = row[icaoCol];
		try {
			s.latitude = parseCoordinate(row[latCol]);
			s.longitude = parseCoordinate(row[lonCol]);
			s.elevation = parseCoordinate(row[elevCol]);
		} catch (const std::logic_error&) {
			reader.fail("invalid coordinates for station " + usaf);
		}
		current.end = row[endCol];
	}

	std::size_t added = 0;
	for (auto& entry : mostRecent) {
		StationMetadata& s = entry.second.station;
		if (s.usafId == "999999" || !s.latitude || !s.longitude)
			continue;
		if (_country && s.country != *_country)
			continue;
		_store.addStation(std::move(s));
		added++;
	}

	std::cerr << SD_INFO << "[ISD] management: " << "Loaded " << added << " stations from " << name << std::endl;
	return added;
}

std::size_t IsdCatalogLoader::loadInventory(std::istream& input, const std::string& name)
{
	CsvReader reader{input, name};
	const std::size_t usafCol = reader.column("usaf");
	const std::size_t wbanCol = reader.column("wban");
	const std::size_t yearCol = reader.column("year");
	std::array<std::size_t, 12> monthCols;
	for (const auto& month : MONTHS)
		monthCols[month.second - 1] = reader.column(month.first);

	std::size_t added = 0;
	std::vector<std::string> row;
	while (reader.next(row)) {
		if (!_store.hasStation(row[usafCol]))
			continue;

		FileInventory inventory;
		inventory.usafId = row[usafCol];
		inventory.wbanId = row[wbanCol];
		try {
			inventory.year = parseInteger(row[yearCol]);
			for (std::size_t m = 0 ; m < 12 ; m++)
				inventory.monthlyCounts[m] = parseInteger(row[monthCols[m]]);
		} catch (const std::logic_error&) {
			reader.fail("invalid count for station " + inventory.usafId);
		}

		if (inventory.year < MIN_YEAR)
			continue;

		grade(inventory);
		_store.addFileInventory(std::move(inventory));
		added++;
	}

	std::cerr << SD_INFO << "[ISD] management: " << "Loaded " << added << " files from " << name << std::endl;
	return added;
}

void IsdCatalogLoader::grade(FileInventory& inventory) const
{
	const date::sys_days today{_today};

	inventory.count = 0;
	inventory.nZeroMonths = 0;
	chrono::hours hoursInYear{0};
	for (unsigned int m = 1 ; m <= 12 ; m++) {
		date::year_month ym{date::year{inventory.year}, date::month{m}};
		date::sys_days monthStart{ym / 1};
		if (monthStart > today)
			break;

		date::sys_days monthEnd{ym / date::last};
		if (today <= monthEnd)
			hoursInYear += today - monthStart;
		else
			hoursInYear += (monthEnd - monthStart) + date::days{1};

		int count = inventory.monthlyCounts[m - 1];
		inventory.count += count;
		if (count == 0)
			inventory.nZeroMonths++;
	}

	if (inventory.count >= 0.9 * hoursInYear.count() && inventory.nZeroMonths == 0)
		inventory.quality = "high";
	else if (inventory.count >= 0.5 * hoursInYear.count() && inventory.nZeroMonths <= 2)
		inventory.quality = "medium";
	else
		inventory.quality = "low";
}

}
