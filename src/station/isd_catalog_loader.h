/**
 * @file isd_catalog_loader.h
 * @brief Definition of the IsdCatalogLoader class
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

#ifndef ISD_CATALOG_LOADER_H
#define ISD_CATALOG_LOADER_H

#include <cstddef>
#include <string>
#include <istream>
#include <optional>
#include <utility>

#include <date/date.h>

#include "../transport/transport.h"
#include "in_memory_metadata_store.h"

namespace meteoisd
{

/**
 * @brief Fill a metadata store from the catalog files published by NOAA
 *
 * NOAA publishes the history of all ISD stations in isd-history.csv and
 * the number of observations of each file, month by month, in
 * isd-inventory.csv. Both are available in /pub/data/noaa/ on the NOAA
 * servers.
 */
class IsdCatalogLoader
{
public:
	/**
	 * @brief Files older than this year are not loaded
	 */
	static constexpr int MIN_YEAR = 2005;

	//! The station history in the NOAA archive
	static constexpr char HISTORY_FILENAME[] = "/pub/data/noaa/isd-history.csv";
	//! The file inventory in the NOAA archive, compressed
	static constexpr char INVENTORY_FILENAME[] = "/pub/data/noaa/isd-inventory.csv.z";

	/**
	 * @brief Fetch a catalog file and save it, decompressed, to a local file
	 *
	 * The file is entirely retrieved before the destination is replaced,
	 * so a failed download leaves the previous copy untouched. Missing
	 * parent directories are created.
	 *
	 * @param transport The transport to retrieve the file with
	 * @param filename The name of the file in the archive, such as
	 * HISTORY_FILENAME
	 * @param destination The path of the local copy
	 * @return The size of the local copy, in bytes
	 * @throw TransportError If the file cannot be retrieved
	 * @throw std::runtime_error If the local copy cannot be written
	 */
	static std::size_t download(Transport& transport, const std::string& filename, const std::string& destination);

	/**
	 * @param store The store to fill
	 * @param today The current date, months after it are not taken into
	 * account when grading the quality of the files
	 */
	IsdCatalogLoader(InMemoryMetadataStore& store, date::year_month_day today);

	/**
	 * @brief Only keep the stations from a country
	 *
	 * @param country The FIPS country code ("US" for instance), or nothing
	 * to keep stations from everywhere (the default)
	 */
	inline void setCountry(std::optional<std::string> country)
	{
		_country = std::move(country);
	}

	/**
	 * @brief Load the stations from the content of isd-history.csv
	 *
	 * The most recent row of each USAF identifier describes the station,
	 * the WBAN identifiers of all the rows are kept. Placeholder
	 * stations (USAF identifier 999999) and stations without
	 * coordinates are ignored.
	 *
	 * @param input The CSV content
	 * @param name The name of the file, for error messages
	 * @return The number of stations added to the store
	 * @throw FormatError If the file is not a valid history file
	 */
	std::size_t loadHistory(std::istream& input, const std::string& name = "isd-history.csv");

	/**
	 * @brief Load the files from the content of isd-inventory.csv
	 *
	 * Only the files of stations already in the store are loaded, so the
	 * history must be loaded first.
	 *
	 * @param input The CSV content
	 * @param name The name of the file, for error messages
	 * @return The number of files added to the store
	 * @throw FormatError If the file is not a valid inventory file
	 */
	std::size_t loadInventory(std::istream& input, const std::string& name = "isd-inventory.csv");

	/**
	 * @brief Grade the completeness of a file
	 *
	 * A file is of high quality if it holds observations for at least 90%
	 * of the hours of the year (so far) and has no empty month. It is of
	 * medium quality if it covers at least half the hours and has at most
	 * two empty months. Otherwise, it is of low quality.
	 *
	 * @param inventory The file, whose monthly counts are set, count and
	 * nZeroMonths are computed
	 */
	void grade(FileInventory& inventory) const;

private:
	InMemoryMetadataStore& _store;
	date::year_month_day _today;
	std::optional<std::string> _country;
};

}

#endif /* ISD_CATALOG_LOADER_H */
