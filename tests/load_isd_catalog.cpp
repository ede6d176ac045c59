#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <filesystem>

#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <date/date.h>

#include "../src/errors.h"
#include "../src/transport/transport.h"
#include "../src/station/in_memory_metadata_store.h"
#include "../src/station/isd_catalog_loader.h"

using namespace meteoisd;
using namespace date;
namespace fs = std::filesystem;
namespace io = boost::iostreams;

namespace
{
	const year_month_day TODAY = 2025_y/March/15;

	const std::string HISTORY =
		"\"USAF\",\"WBAN\",\"STATION NAME\",\"CTRY\",\"STATE\",\"ICAO\",\"LAT\",\"LON\",\"ELEV(M)\",\"BEGIN\",\"END\"\n"
		"\"071560\",\"99999\",\"PARIS-MONTSOURIS\",\"FR\",\"\",\"LFPM\",\"+48.817\",\"+002.333\",\"+0075.0\",\"19730101\",\"20250101\"\n"
		"\"123456\",\"99999\",\"NOWHERE\",\"FR\",\"\",\"\",\"\",\"\",\"\",\"20000101\",\"20200101\"\n"
		"\"720534\",\"00161\",\"ERIE MUNICIPAL AIRPORT\",\"US\",\"CO\",\"KEIK\",\"+40.017\",\"-105.050\",\"+1551.0\",\"20100101\",\"20250101\"\r\n"
		"\"720534\",\"99999\",\"ERIE MUNI\",\"US\",\"CO\",\"\",\"+40.017\",\"-105.050\",\"+0.0\",\"20050101\",\"20100101\"\n"
		"\"999999\",\"00100\",\"BOGUS\",\"US\",\"\",\"\",\"+10.000\",\"+10.000\",\"+0.0\",\"20050101\",\"20250101\"\n";

	std::string inventoryRow(const std::string& usaf, int year, const std::vector<int>& counts)
	{
		std::string row = "\"" + usaf + "\",\"00161\",\"" + std::to_string(year) + "\"";
		for (int c : counts)
			row += ",\"" + std::to_string(c) + "\"";
		return row + "\n";
	}

	const std::string INVENTORY =
		"\"USAF\",\"WBAN\",\"YEAR\",\"JAN\",\"FEB\",\"MAR\",\"APR\",\"MAY\",\"JUN\",\"JUL\",\"AUG\",\"SEP\",\"OCT\",\"NOV\",\"DEC\"\n" +
		inventoryRow("720534", 2004, std::vector<int>(12, 744)) +
		inventoryRow("720534", 2023, std::vector<int>(12, 744)) +
		inventoryRow("720534", 2022, {744, 744, 744, 0, 744, 744, 744, 744, 0, 744, 744, 744}) +
		inventoryRow("720534", 2021, std::vector<int>(12, 100)) +
		inventoryRow("720534", 2025, {744, 672, 336, 0, 0, 0, 0, 0, 0, 0, 0, 0}) +
		inventoryRow("999999", 2025, std::vector<int>(12, 744));

	class FakeTransport : public Transport
	{
	public:
		std::map<std::string, std::string> files;

	protected:
		std::string retrieve(const std::string& filename) override
		{
			auto it = files.find(filename);
			if (it == files.end())
				throw TransportError{filename, "no such file"};
			return it->second;
		}
	};

	std::string gzip(const std::string& data)
	{
		std::string compressed;
		io::filtering_ostream out;
		out.push(io::gzip_compressor{});
		out.push(io::back_inserter(compressed));
		out << data;
		out.reset();
		return compressed;
	}

	InMemoryMetadataStore loadStore()
	{
		InMemoryMetadataStore store;
		IsdCatalogLoader loader{store, TODAY};
		std::istringstream history{HISTORY};
		loader.loadHistory(history);
		std::istringstream inventory{INVENTORY};
		loader.loadInventory(inventory);
		return store;
	}

	void testHistory()
	{
		InMemoryMetadataStore store;
		IsdCatalogLoader loader{store, TODAY};
		std::istringstream history{HISTORY};
		assert(loader.loadHistory(history) == 2);
		assert(store.getStationCount() == 2);
		assert(!store.hasStation("999999"));
		assert(!store.hasStation("123456"));

		std::optional<StationMetadata> erie = store.getStation("720534");
		assert(erie);
		assert(erie->name == "ERIE MUNICIPAL AIRPORT");
		assert(erie->recentWbanId == "00161");
		assert(erie->wbanIds == (std::vector<std::string>{"00161", "99999"}));
		assert(erie->icaoCode == "KEIK");
		assert(erie->state == "CO");
		assert(std::abs(*erie->latitude - 40.017) < 1e-9);
		assert(std::abs(*erie->longitude + 105.05) < 1e-9);
		assert(std::abs(*erie->elevation - 1551.) < 1e-9);

		std::optional<StationMetadata> paris = store.getStation("071560");
		assert(paris);
		assert(paris->state.empty());
		assert(std::abs(*paris->longitude - 2.333) < 1e-9);
		std::cout << "history passed" << std::endl;
	}

	void testCountryFilter()
	{
		InMemoryMetadataStore store;
		IsdCatalogLoader loader{store, TODAY};
		loader.setCountry(std::string{"US"});
		std::istringstream history{HISTORY};
		assert(loader.loadHistory(history) == 1);
		assert(store.hasStation("720534"));
		assert(!store.hasStation("071560"));
		std::cout << "country filter passed" << std::endl;
	}

	void testInventory()
	{
		InMemoryMetadataStore store;
		IsdCatalogLoader loader{store, TODAY};
		std::istringstream history{HISTORY};
		loader.loadHistory(history);
		std::istringstream inventory{INVENTORY};
		// 2004 is too old and 999999 is not a station
		assert(loader.loadInventory(inventory) == 4);
		assert(store.getFileCount() == 4);

		std::vector<FileInventory> files = store.getFileInventory("720534", std::nullopt);
		assert(files.size() == 4);
		assert(files[0].year == 2021);
		assert(files[1].year == 2022);
		assert(files[2].year == 2023);
		assert(files[3].year == 2025);
		assert(files[0].wbanId == "00161");
		assert(store.getFileInventory("720534", 2004).empty());
		assert(store.getFileInventory("720534", 2023).size() == 1);
		std::cout << "inventory passed" << std::endl;
	}

	void testQualityGrades()
	{
		InMemoryMetadataStore store = loadStore();

		FileInventory full = store.getFileInventory("720534", 2023).front();
		assert(full.count == 12 * 744);
		assert(full.nZeroMonths == 0);
		assert(full.quality == "high");

		FileInventory gaps = store.getFileInventory("720534", 2022).front();
		assert(gaps.count == 10 * 744);
		assert(gaps.nZeroMonths == 2);
		assert(gaps.quality == "medium");

		FileInventory sparse = store.getFileInventory("720534", 2021).front();
		assert(sparse.count == 1200);
		assert(sparse.quality == "low");

		// the months after today are neither counted nor empty
		FileInventory current = store.getFileInventory("720534", 2025).front();
		assert(current.count == 744 + 672 + 336);
		assert(current.nZeroMonths == 0);
		assert(current.quality == "high");
		std::cout << "quality grades passed" << std::endl;
	}

	void testDownload()
	{
		FakeTransport transport;
		transport.files[IsdCatalogLoader::HISTORY_FILENAME] = HISTORY;
		transport.files[IsdCatalogLoader::INVENTORY_FILENAME] = gzip(INVENTORY);

		fs::path directory = fs::temp_directory_path() / "meteoisd-load-isd-catalog";
		fs::remove_all(directory);
		const std::string historyFile = (directory / "catalog" / "isd-history.csv").string();
		const std::string inventoryFile = (directory / "catalog" / "isd-inventory.csv").string();

		assert(IsdCatalogLoader::download(transport, IsdCatalogLoader::HISTORY_FILENAME, historyFile) == HISTORY.size());
		assert(IsdCatalogLoader::download(transport, IsdCatalogLoader::INVENTORY_FILENAME, inventoryFile) == INVENTORY.size());
		assert(!fs::exists(inventoryFile + ".part"));

		InMemoryMetadataStore store;
		IsdCatalogLoader loader{store, TODAY};
		std::ifstream history{historyFile};
		assert(loader.loadHistory(history, historyFile) == 2);
		std::ifstream inventory{inventoryFile};
		assert(loader.loadInventory(inventory, inventoryFile) == 4);

		// a failed download keeps the previous copy
		transport.files.erase(IsdCatalogLoader::INVENTORY_FILENAME);
		bool thrown = false;
		try {
			IsdCatalogLoader::download(transport, IsdCatalogLoader::INVENTORY_FILENAME, inventoryFile);
		} catch (const TransportError& e) {
			thrown = true;
			assert(e.getFilename() == IsdCatalogLoader::INVENTORY_FILENAME);
		}
		assert(thrown);
		assert(fs::file_size(inventoryFile) == INVENTORY.size());

		fs::remove_all(directory);
		std::cout << "download passed" << std::endl;
	}

	void testMalformedFiles()
	{
		InMemoryMetadataStore store;
		IsdCatalogLoader loader{store, TODAY};
		std::istringstream history{HISTORY};
		loader.loadHistory(history);

		std::istringstream badYear{
			"USAF,WBAN,YEAR,JAN,FEB,MAR,APR,MAY,JUN,JUL,AUG,SEP,OCT,NOV,DEC\n"
			"720534,00161,2023,1,1,1,1,1,1,1,1,1,1,1,1\n"
			"720534,00161,20x4,1,1,1,1,1,1,1,1,1,1,1,1\n"
		};
		bool thrown = false;
		try {
			loader.loadInventory(badYear, "inventory.csv");
		} catch (const FormatError& e) {
			thrown = true;
			assert(e.getFilename() && *e.getFilename() == "inventory.csv");
			assert(e.getLineNumber() && *e.getLineNumber() == 3);
		}
		assert(thrown);

		std::istringstream missingColumn{"USAF,WBAN,YEAR\n720534,00161,2023\n"};
		thrown = false;
		try {
			loader.loadInventory(missingColumn);
		} catch (const FormatError& e) {
			thrown = true;
			assert(std::string{e.what()}.find("jan") != std::string::npos);
		}
		assert(thrown);

		std::istringstream empty{""};
		thrown = false;
		try {
			loader.loadHistory(empty);
		} catch (const FormatError&) {
			thrown = true;
		}
		assert(thrown);
		std::cout << "malformed files passed" << std::endl;
	}
}

int main()
{
	testHistory();
	testCountryFilter();
	testInventory();
	testQualityGrades();
	testMalformedFiles();
	testDownload();
}
