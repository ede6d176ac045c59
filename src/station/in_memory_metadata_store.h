/**
 * @file in_memory_metadata_store.h
 * @brief Definition of the InMemoryMetadataStore class
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

#ifndef IN_MEMORY_METADATA_STORE_H
#define IN_MEMORY_METADATA_STORE_H

#include <cstddef>
#include <string>
#include <vector>
#include <map>
#include <tuple>
#include <optional>

#include "station_metadata_store.h"

namespace meteoisd
{

/**
 * @brief A catalog of stations and files held in memory
 */
class InMemoryMetadataStore : public StationMetadataStore
{
public:
	/**
	 * @brief Add a station, replacing any station with the same USAF
	 * identifier
	 */
	void addStation(StationMetadata station);

	/**
	 * @brief Add a file, replacing any file with the same station, WBAN
	 * identifier and year
	 */
	void addFileInventory(FileInventory inventory);

	bool hasStation(const std::string& usafId) const;

	std::optional<StationMetadata> getStation(const std::string& usafId) const override;
	std::vector<FileInventory> getFileInventory(const std::string& usafId, std::optional<int> year) const override;

	inline std::size_t getStationCount() const
	{
		return _stations.size();
	}

	inline std::size_t getFileCount() const
	{
		return _files.size();
	}

private:
	std::map<std::string, StationMetadata> _stations;
	//! Indexed by USAF identifier, year and WBAN identifier, in that order
	std::map<std::tuple<std::string, int, std::string>, FileInventory> _files;
};

}

#endif /* IN_MEMORY_METADATA_STORE_H */
