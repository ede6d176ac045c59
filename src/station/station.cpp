/**
 * @file station.cpp
 * @brief Implementation of the Station class
 * @author Laurent Georget
 * @date 2026-03-06
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
#include <set>
#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>
#include <memory>
#include <iterator>

#include <systemd/sd-daemon.h>

#include "../errors.h"
#include "../time_offseter.h"
#include "../isd/isd_record.h"
#include "../isd/isd_record_parser.h"
#include "../rollup/period.h"
#include "../rollup/rollup.h"
#include "../rollup/time_series.h"
#include "../transport/transport.h"
#include "station_metadata_store.h"
#include "observation_fields.h"
#include "field_selection.h"
#include "observation_table.h"
#include "station.h"

namespace meteoisd
{

namespace
{
	bool contains(const std::string& column, const char* pattern)
	{
		return column.find(pattern) != std::string::npos;
	}
}

FetchOptions::TemperatureScale FetchOptions::parseTemperatureScale(const std::string& scale)
{
	std::string s = scale;
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
	if (s == "c")
		return TemperatureScale::CELSIUS;
	else if (s == "f")
		return TemperatureScale::FAHRENHEIT;
	else if (s == "both" || s.empty())
		return TemperatureScale::BOTH;
	throw ConfigurationError{"Unknown temperature scale '" + scale + "', expected C, F or both"};
}

Station::Station(const std::string& usafId, const StationMetadataStore& store) :
	_store{store}
{
	std::optional<StationMetadata> metadata = store.getStation(usafId);
	if (!metadata)
		throw ConfigurationError{"Unknown station " + usafId};
	_metadata = std::move(*metadata);
}

std::vector<int> Station::getYears() const
{
	std::set<int> years;
	for (const FileInventory& f : _store.getFileInventory(_metadata.usafId, std::nullopt))
		years.insert(f.year);
	return {years.begin(), years.end()};
}

std::string Station::buildFilename(const std::string& wbanId, int year) const
{
	std::string y = std::to_string(year);
	return "/pub/data/noaa/" + y + "/" + _metadata.usafId + "-" + wbanId + "-" + y + ".gz";
}

std::vector<std::string> Station::getFilenames(std::optional<int> year) const
{
	std::vector<std::string> filenames;
	for (const FileInventory& f : _store.getFileInventory(_metadata.usafId, year))
		filenames.push_back(buildFilename(f.wbanId, f.year));

	if (!filenames.empty())
		return filenames;

	if (!year) {
		std::cerr << SD_WARNING << "[ISD " << _metadata.usafId << "] management: "
			  << "No file is known for this station" << std::endl;
	} else if (_guessFilenames) {
		filenames.push_back(buildFilename(_metadata.recentWbanId, *year));
		std::cerr << SD_WARNING << "[ISD " << _metadata.usafId << "] management: "
			  << "No file is known for year " << *year << ", trying " << filenames.front()
			  << " which may not exist" << std::endl;
	} else {
		std::cerr << SD_WARNING << "[ISD " << _metadata.usafId << "] management: "
			  << "No file is known for year " << *year << ", skipping it" << std::endl;
	}
	return filenames;
}

std::vector<FileInventory> Station::qualityReport(std::optional<int> year) const
{
	return _store.getFileInventory(_metadata.usafId, year);
}

std::vector<IsdRecord> Station::readRecords(std::istream& input, const std::string& filename)
{
	std::vector<IsdRecord> records;
	std::string line;
	std::size_t lineNumber = 0;
	while (std::getline(input, line)) {
		lineNumber++;
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		if (line.empty()) {
			std::cerr << SD_WARNING << "[ISD] measurement: " << filename << ", line " << lineNumber
				  << ": skipping empty line" << std::endl;
			continue;
		}

		try {
			records.push_back(parseLine(line));
		} catch (const FormatError& e) {
			throw FormatError{e, filename, lineNumber};
		}
	}
	return records;
}

std::vector<IsdRecord> Station::fetchRecords(const std::vector<int>& years, Transport& transport) const
{
	std::vector<std::string> filenames;
	for (int year : years) {
		std::vector<std::string> f = getFilenames(year);
		filenames.insert(filenames.end(), f.begin(), f.end());
	}

	std::vector<IsdRecord> records;
	for (const std::string& filename : filenames) {
		std::unique_ptr<std::istream> input = transport.open(filename);
		std::vector<IsdRecord> fileRecords = readRecords(*input, filename);
		std::cerr << SD_INFO << "[ISD " << _metadata.usafId << "] measurement: "
			  << "Parsed " << fileRecords.size() << " records from " << filename << std::endl;
		std::move(fileRecords.begin(), fileRecords.end(), std::back_inserter(records));
	}

	std::stable_sort(records.begin(), records.end(), [](const IsdRecord& r1, const IsdRecord& r2) {
		return r1.getDateTime() < r2.getDateTime();
	});
	return records;
}

ObservationTable Station::buildTable(const std::vector<IsdRecord>& records,
	const std::vector<const ObservationField*>& fields, bool includeControl)
{
	std::vector<const ObservationField*> columns;
	if (includeControl) {
		for (const ObservationField& f : getControlFields())
			columns.push_back(&f);
	}
	columns.insert(columns.end(), fields.begin(), fields.end());

	std::vector<std::string> names;
	for (const ObservationField* f : columns)
		names.push_back(f->getColumnName());

	ObservationTable table{std::move(names)};
	for (const IsdRecord& record : records) {
		ObservationTable::Row row;
		row.reserve(columns.size());
		for (const ObservationField* f : columns)
			row.push_back(f->extract(record));
		table.append(record.getDateTime(), std::move(row));
	}
	return table;
}

ObservationTable Station::fetchTable(const std::vector<int>& years, const FetchOptions& options, Transport& transport) const
{
	std::vector<const ObservationField*> fields = options.selection.resolve();
	TimeOffseter tz = TimeOffseter::getTimeOffseterFor(options.timezone);
	if (options.period && options.rollup == RollupPolicy::MIDPOINT)
		checkMidpointPeriod(*options.period);

	std::vector<IsdRecord> records = fetchRecords(years, transport);
	ObservationTable table = buildTable(records, fields, options.includeControl);

	if (!options.includeQualityCodes)
		table.dropColumns([](const std::string& c) { return contains(c, "quality_code"); });
	if (options.temperatureScale == FetchOptions::TemperatureScale::CELSIUS)
		table.dropColumns([](const std::string& c) { return contains(c, "temperature_f"); });
	else if (options.temperatureScale == FetchOptions::TemperatureScale::FAHRENHEIT)
		table.dropColumns([](const std::string& c) { return contains(c, "temperature_c"); });

	if (options.period) {
		std::set<std::string> aggregable;
		for (const ObservationField& f : getObservationFields()) {
			if (f.aggregable)
				aggregable.insert(f.getColumnName());
		}
		table.dropColumns([&aggregable](const std::string& c) { return aggregable.count(c) == 0; });

		std::cerr << SD_DEBUG << "[ISD " << _metadata.usafId << "] measurement: "
			  << "Rolling up " << table.size() << " records over " << options.period->toString()
			  << " (" << toString(options.rollup) << ")" << std::endl;
		TimeSeries series = rollup(table.toTimeSeries(), *options.period, options.rollup, options.upsampleFirst);
		table = ObservationTable::fromTimeSeries(series);
	}

	table.setDisplayTimezone(std::move(tz));
	return table;
}

}
