/**
 * @file isd_fetch_standalone.cpp
 * @brief Download, decode and aggregate ISD observations of a station
 * @author Laurent Georget
 * @date 2026-03-09
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
#include <fstream>
#include <chrono>
#include <string>
#include <vector>
#include <optional>
#include <memory>

#include <boost/program_options.hpp>
#include <systemd/sd-daemon.h>
#include <date/date.h>

#include "config.h"
#include "errors.h"
#include "transport/transport.h"
#include "transport/curl_transport.h"
#include "transport/local_mirror_transport.h"
#include "station/in_memory_metadata_store.h"
#include "station/isd_catalog_loader.h"
#include "station/field_selection.h"
#include "station/observation_fields.h"
#include "station/observation_table.h"
#include "station/station.h"
#include "rollup/period.h"
#include "rollup/rollup.h"

/**
 * @brief The configuration file default path
 */
#define DEFAULT_CONFIG_FILE "/etc/meteoisd/meteoisd.conf"

using namespace meteoisd;
namespace po = boost::program_options;
namespace chrono = std::chrono;

namespace
{
	void loadCatalog(InMemoryMetadataStore& store, const std::string& historyFile,
		const std::string& inventoryFile, const std::string& country)
	{
		date::year_month_day today{date::floor<date::days>(chrono::system_clock::now())};
		IsdCatalogLoader loader{store, today};
		if (!country.empty())
			loader.setCountry(country);

		std::ifstream history{historyFile};
		if (!history)
			throw ConfigurationError{"Cannot open the station history file " + historyFile};
		loader.loadHistory(history, historyFile);

		std::ifstream inventory{inventoryFile};
		if (!inventory)
			throw ConfigurationError{"Cannot open the file inventory " + inventoryFile};
		loader.loadInventory(inventory, inventoryFile);
	}

	std::unique_ptr<Transport> makeTransport(const std::string& mirrorDirectory, bool useHttp, long timeout)
	{
		if (!mirrorDirectory.empty())
			return std::make_unique<LocalMirrorTransport>(mirrorDirectory);
		return std::make_unique<CurlTransport>(
			useHttp ? CurlTransport::HTTP_BASE_URL : CurlTransport::FTP_BASE_URL,
			chrono::seconds{timeout});
	}

	void output(const ObservationTable& table, const std::string& format)
	{
		if (format == "json")
			table.writeJson(std::cout);
		else
			table.writeCsv(std::cout);
	}

	void printQualityReport(const std::vector<FileInventory>& report)
	{
		std::cout << "usaf_id,wban_id,year,quality,jan,feb,mar,apr,may,jun,jul,aug,sep,oct,nov,dec,count,n_zero_months\n";
		for (const FileInventory& f : report) {
			std::cout << f.usafId << "," << f.wbanId << "," << f.year << "," << f.quality;
			for (int count : f.monthlyCounts)
				std::cout << "," << count;
			std::cout << "," << f.count << "," << f.nZeroMonths << "\n";
		}
		std::cout << std::flush;
	}
}

/**
 * @brief Entry point
 *
 * @param argc the number of arguments passed on the command line
 * @param argv the arguments passed on the command line
 *
 * @return 0 if everything went well, 1 if the options are invalid, and 255
 * otherwise
 */
int main(int argc, char** argv)
{
	std::string historyFile;
	std::string inventoryFile;
	std::string country;
	std::string mirrorDirectory;
	bool useHttp = false;
	long timeout;

	std::string stationId;
	std::vector<int> years;
	std::vector<std::string> datum;
	std::vector<std::string> included;
	std::vector<std::string> excluded;
	std::string period;
	std::string rollupPolicy;
	std::string tz;
	std::string tempScale;
	std::string format;
	std::string inputFile;

	po::options_description config("Configuration");
	config.add_options()
		("history-file", po::value<std::string>(&historyFile)->default_value("/var/lib/meteoisd/isd-history.csv"), "NOAA station history (isd-history.csv)")
		("inventory-file", po::value<std::string>(&inventoryFile)->default_value("/var/lib/meteoisd/isd-inventory.csv"), "NOAA file inventory (isd-inventory.csv)")
		("country", po::value<std::string>(&country), "only load the stations of this country (FIPS code, such as US)")
		("use-http", po::bool_switch(&useHttp), "download from the NOAA HTTPS server instead of the FTP server")
		("mirror-directory", po::value<std::string>(&mirrorDirectory), "read the ISD files from a local copy of the NOAA archive instead of downloading them")
		("timeout", po::value<long>(&timeout)->default_value(30), "maximum duration of each download, in seconds (0 for no limit)")
	;

	po::options_description desc("Allowed options");
	desc.add_options()
		("help", "display the help message and exit")
		("version", "display the version of meteoisd and exit")
		("config-file", po::value<std::string>(), "alternative configuration file")
		("station,s", po::value<std::string>(&stationId), "the USAF identifier of the station")
		("year,y", po::value<std::vector<int>>(&years)->multitoken(), "the years to fetch (can be given multiple times)")
		("datum,d", po::value<std::vector<std::string>>(&datum)->multitoken(), "the observation groups to output: wind, ceiling, visibility, air_temperature, dew_point, sea_level_pressure (can be given multiple times, defaults to all)")
		("include", po::value<std::vector<std::string>>(&included)->multitoken(), "a group or a group.field to output, takes precedence over --datum (can be given multiple times)")
		("exclude", po::value<std::vector<std::string>>(&excluded)->multitoken(), "a group or a group.field not to output, takes precedence over --datum (can be given multiple times)")
		("period,p", po::value<std::string>(&period), "aggregate the observations over this period (h, 15min, 1D, MS, etc.)")
		("rollup,r", po::value<std::string>(&rollupPolicy)->default_value("ending"), "how to aggregate: starting, ending, midpoint or instant")
		("no-upsample", "aggregate the raw observations instead of a per-minute interpolation")
		("tz", po::value<std::string>(&tz)->default_value("UTC"), "the timezone to display the timestamps in")
		("include-control", "output the control data of the records")
		("no-quality-codes", "do not output the quality codes")
		("temp-scale", po::value<std::string>(&tempScale)->default_value("both"), "the temperature scale: C, F or both")
		("raw", "output all the fields of the records, without filtering nor aggregation")
		("format,f", po::value<std::string>(&format)->default_value("csv"), "the output format: csv or json")
		("input-file,i", po::value<std::string>(&inputFile), "decode a local ISD file, compressed or not, and output its records")
		("quality-report", "output the inventory of the files of the station")
		("download-metadata", "download the station history and the file inventory from NOAA to history-file and inventory-file, and exit")
	;
	desc.add(config);

	try {
		po::variables_map vm;
		po::store(po::parse_command_line(argc, argv, desc), vm);
		std::string configFileName = vm.count("config-file") ? vm["config-file"].as<std::string>() : DEFAULT_CONFIG_FILE;
		std::ifstream configFile(configFileName);
		if (configFile) {
			po::store(po::parse_config_file(configFile, config, true), vm);
			configFile.close();
		}
		po::notify(vm);

		if (vm.count("help")) {
			std::cout << PACKAGE_STRING"\n";
			std::cout << "Usage: " << argv[0] << " -s usaf_id -y year [options]\n";
			std::cout << "       " << argv[0] << " -i isd_file [options]\n";
			std::cout << "       " << argv[0] << " --download-metadata [options]\n";
			std::cout << desc << std::endl;
			return 0;
		}

		if (vm.count("version")) {
			std::cout << VERSION << std::endl;
			return 0;
		}

		if (format != "csv" && format != "json")
			throw ConfigurationError{"Unknown output format '" + format + "', expected csv or json"};

		if (vm.count("input-file")) {
			LocalMirrorTransport transport{!inputFile.empty() && inputFile.front() == '/' ? "" : "."};
			std::unique_ptr<std::istream> input = transport.open(inputFile);
			std::vector<IsdRecord> records = Station::readRecords(*input, inputFile);
			std::vector<const ObservationField*> fields;
			for (const ObservationField& f : getObservationFields())
				fields.push_back(&f);
			ObservationTable table = Station::buildTable(records, fields, true);
			table.setDisplayTimezone(TimeOffseter::getTimeOffseterFor(tz));
			output(table, format);
			return 0;
		}

		if (vm.count("download-metadata")) {
			std::unique_ptr<Transport> transport = makeTransport(mirrorDirectory, useHttp, timeout);
			IsdCatalogLoader::download(*transport, IsdCatalogLoader::HISTORY_FILENAME, historyFile);
			IsdCatalogLoader::download(*transport, IsdCatalogLoader::INVENTORY_FILENAME, inventoryFile);
			return 0;
		}

		if (stationId.empty())
			throw ConfigurationError{"A station is required (--station)"};

		InMemoryMetadataStore store;
		loadCatalog(store, historyFile, inventoryFile, country);
		Station station{stationId, store};

		if (vm.count("quality-report")) {
			if (years.empty()) {
				printQualityReport(station.qualityReport(std::nullopt));
			} else {
				for (int year : years)
					printQualityReport(station.qualityReport(year));
			}
			return 0;
		}

		if (years.empty())
			throw ConfigurationError{"At least one year is required (--year)"};

		FetchOptions options;
		if (vm.count("raw")) {
			options.includeControl = true;
			options.timezone = tz;
		} else {
			options.selection = FieldSelection{datum};
			for (const std::string& spec : included)
				options.selection.addFieldSpec(spec, false);
			for (const std::string& spec : excluded)
				options.selection.addFieldSpec(spec, true);
			if (vm.count("period"))
				options.period = Period::parse(period);
			options.rollup = parseRollupPolicy(rollupPolicy);
			options.upsampleFirst = !vm.count("no-upsample");
			options.timezone = tz;
			options.includeControl = vm.count("include-control");
			options.includeQualityCodes = !vm.count("no-quality-codes");
			options.temperatureScale = FetchOptions::parseTemperatureScale(tempScale);
		}

		std::unique_ptr<Transport> transport = makeTransport(mirrorDirectory, useHttp, timeout);

		ObservationTable table = station.fetchTable(years, options, *transport);
		std::cerr << SD_NOTICE << "[ISD " << stationId << "] management: "
			  << "Got " << table.size() << " rows" << std::endl;
		output(table, format);
	} catch (const po::error& e) {
		std::cerr << SD_ERR << e.what() << std::endl;
		return 1;
	} catch (const ConfigurationError& e) {
		std::cerr << SD_ERR << e.what() << std::endl;
		return 1;
	} catch (const std::exception& e) {
		std::cerr << SD_ERR << e.what() << std::endl;
		return 255;
	}

	return 0;
}
