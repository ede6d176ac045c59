/**
 * @file in_memory_metadata_store.cpp
 * @brief Implementation of the InMemoryMetadataStore class
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

#include <string>
#include <vector>
#include <tuple>
#include <limits>
#include <optional>
#include <utility>

#include "in_memory_metadata_store.h"

namespace meteoisd
{

void InMemoryMetadataStore::addStation(StationMetadata station)
{
	std::string id = station.usafId;
	_stations[id] = std::move(station);
}

void InMemoryMetadataStore::addFileInventory(FileInventory inventory)
{
	auto key = std::make_tuple(inventory.usafId, inventory.year, inventory.wbanId);
	_files[key] = std::move(inventory);
}

bool InMemoryMetadataStore::hasStation(const std::string& usafId) const
{
	return _stations.find(usafId) != _stations.end();
}

std::optional<StationMetadata> InMemoryMetadataStore::getStation(const std::string& usafId) const
{
	auto it = _stations.find(usafId);
	if (it == _stations.end())
		return std::nullopt;
	return it->second;
}

std::vector<FileInventory> InMemoryMetadataStore::getFileInventory(const std::string& usafId, std::optional<int> year) const
{
	int minYear = year ? *year : std::numeric_limits<int>::min();
	int maxYear = year ? *year : std::numeric_limits<int>::max();

	std::vector<FileInventory> result;
	for (auto it = _files.lower_bound(std::make_tuple(usafId, minYear, std::string{})) ;
	     it != _files.end() && std::get<0>(it->first) == usafId && std::get<1>(it->first) <= maxYear ;
	     ++it)
		result.push_back(it->second);
	return result;
}

}
