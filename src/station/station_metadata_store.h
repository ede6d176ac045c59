/**
 * @file station_metadata_store.h
 * @brief Definition of the StationMetadataStore interface
 * @author Laurent Georget
 * @date 2026-03-02
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

#ifndef STATION_METADATA_STORE_H
#define STATION_METADATA_STORE_H

#include <array>
#include <string>
#include <vector>
#include <optional>

namespace meteoisd
{

/**
 * @brief What is known about an ISD station
 */
struct StationMetadata
{
	std::string usafId;
	//! All the WBAN identifiers the station has had, oldest first
	std::vector<std::string> wbanIds;
	//! The WBAN identifier of the most recent record of the station history
	std::string recentWbanId;
	std::string name;
	std::string icaoCode;
	std::optional<double> latitude;
	std::optional<double> longitude;
	//! Elevation, in meters
	std::optional<double> elevation;
	std::string country;
	std::string state;
};

/**
 * @brief The inventory of one yearly ISD file
 */
struct FileInventory
{
	std::string usafId;
	std::string wbanId;
	int year;
	//! Number of observations for each month, from January to December
	std::array<int, 12> monthlyCounts;
	//! Number of observations in the year, up to the date the inventory was loaded
	int count;
	//! Number of months without observations, up to the date the inventory was loaded
	int nZeroMonths;
	//! "high", "medium" or "low"
	std::string quality;
};

/**
 * @brief The interface of the catalog of stations and files
 *
 * The catalog is consulted to know which files exist before downloading
 * them.
 */
class StationMetadataStore
{
public:
	virtual ~StationMetadataStore() = default;

	/**
	 * @brief Get a station by its USAF identifier
	 * @return The station, or nothing if it is unknown
	 */
	virtual std::optional<StationMetadata> getStation(const std::string& usafId) const = 0;

	/**
	 * @brief Get the files of a station
	 *
	 * @param usafId The USAF identifier of the station
	 * @param year If set, only return the files of that year
	 * @return The files, sorted by year and WBAN identifier
	 */
	virtual std::vector<FileInventory> getFileInventory(const std::string& usafId, std::optional<int> year) const = 0;
};

}

#endif /* STATION_METADATA_STORE_H */
