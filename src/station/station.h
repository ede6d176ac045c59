/**
 * @file station.h
 * @brief Definition of the Station class
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

#ifndef STATION_H
#define STATION_H

#include <string>
#include <vector>
#include <istream>
#include <optional>

#include "../isd/isd_record.h"
#include "../rollup/period.h"
#include "../rollup/rollup.h"
#include "../transport/transport.h"
#include "station_metadata_store.h"
#include "field_selection.h"
#include "observation_table.h"

namespace meteoisd
{

/**
 * @brief How to build an observation table from the records of a station
 */
struct FetchOptions
{
	enum class TemperatureScale
	{
		BOTH, CELSIUS, FAHRENHEIT
	};

	FieldSelection selection;
	//! The length of the aggregation buckets, the records are output as is if not set
	std::optional<Period> period;
	RollupPolicy rollup = RollupPolicy::ENDING;
	//! Whether to resample the records to one value per minute before aggregating them
	bool upsampleFirst = true;
	//! The timezone timestamps are displayed in, computations are always done in UTC
	std::string timezone = "UTC";
	bool includeControl = false;
	bool includeQualityCodes = true;
	TemperatureScale temperatureScale = TemperatureScale::BOTH;

	/**
	 * @brief Parse a temperature scale: "C", "F" or "both" (case does
	 * not matter)
	 * @throw ConfigurationError If the scale is unknown
	 */
	static TemperatureScale parseTemperatureScale(const std::string& scale);
};

/**
 * @brief An ISD station and the means to get its observations
 */
class Station
{
public:
	/**
	 * @param usafId The USAF identifier of the station
	 * @param store The catalog the station is looked up in, it must
	 * outlive the station
	 * @throw ConfigurationError If the station is not in the catalog
	 */
	Station(const std::string& usafId, const StationMetadataStore& store);

	inline const std::string& getUsafId() const
	{
		return _metadata.usafId;
	}

	inline const StationMetadata& getMetadata() const
	{
		return _metadata;
	}

	/**
	 * @brief Get the years for which the catalog has files for the station
	 */
	std::vector<int> getYears() const;

	/**
	 * @brief Choose whether to guess the name of the file of a year
	 * missing from the catalog (the default) or to skip the year
	 */
	inline void setFilenameGuessing(bool guess)
	{
		_guessFilenames = guess;
	}

	/**
	 * @brief Build the names of the ISD files of the station
	 *
	 * When the catalog has no file for the requested year, a warning is
	 * logged and the name of the file is guessed from the most recent WBAN
	 * identifier of the station, unless guessing has been disabled.
	 *
	 * @param year The year of the files, or nothing for all years
	 * @return The names of the files, sorted by year and WBAN identifier
	 */
	std::vector<std::string> getFilenames(std::optional<int> year) const;

	/**
	 * @brief Get the inventory of the files of the station
	 * @param year The year of the files, or nothing for all years
	 */
	std::vector<FileInventory> qualityReport(std::optional<int> year) const;

	/**
	 * @brief Download and parse the ISD files of some years
	 *
	 * @return The records, sorted by observation time, records of the same
	 * time being kept in the order of the files
	 * @throw FormatError If a line is malformed, the error carries the name
	 * of the file and the line number
	 * @throw TransportError If a file cannot be retrieved
	 */
	std::vector<IsdRecord> fetchRecords(const std::vector<int>& years, Transport& transport) const;

	/**
	 * @brief Download the ISD files of some years and build a table of
	 * observations
	 *
	 * The options are checked before anything is downloaded.
	 *
	 * @throw ConfigurationError If the options are invalid
	 * @throw FormatError If a line is malformed
	 * @throw TransportError If a file cannot be retrieved
	 */
	ObservationTable fetchTable(const std::vector<int>& years, const FetchOptions& options, Transport& transport) const;

	/**
	 * @brief Parse all the lines of an ISD file
	 *
	 * @param input The decompressed content of the file
	 * @param filename The name of the file, for error messages
	 * @throw FormatError If a line is malformed
	 */
	static std::vector<IsdRecord> readRecords(std::istream& input, const std::string& filename);

	/**
	 * @brief Build an observation table from records, without any filtering
	 * nor aggregation
	 */
	static ObservationTable buildTable(const std::vector<IsdRecord>& records,
		const std::vector<const ObservationField*>& fields, bool includeControl);

private:
	StationMetadata _metadata;
	const StationMetadataStore& _store;
	bool _guessFilenames = true;

	std::string buildFilename(const std::string& wbanId, int year) const;
};

}

#endif /* STATION_H */
