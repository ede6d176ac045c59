#undef NDEBUG
#include <cassert>
#include <cmath>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <map>
#include <variant>
#include <type_traits>

#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <date/date.h>

#include "../src/errors.h"
#include "../src/curl_wrapper.h"
#include "../src/transport/transport.h"
#include "../src/station/in_memory_metadata_store.h"
#include "../src/station/field_selection.h"
#include "../src/station/observation_table.h"
#include "../src/station/station.h"
#include "../src/rollup/period.h"
#include "../src/rollup/rollup.h"

using namespace meteoisd;
using namespace date;
using namespace std::chrono;
namespace io = boost::iostreams;

// curl holds pointers into the wrapper
static_assert(!std::is_copy_constructible_v<CurlWrapper> && !std::is_move_constructible_v<CurlWrapper>);
static_assert(!std::is_copy_assignable_v<CurlWrapper> && !std::is_move_assignable_v<CurlWrapper>);

namespace
{
	const std::string LINE =
		"0185720534001612025010100154+40017-105050FM-15+156499999V0200601N001512200059N016093199-00151-00941999999";
	const std::string FILE_2025 = "/pub/data/noaa/2025/720534-00161-2025.gz";
	const std::string FILE_2024 = "/pub/data/noaa/2024/720534-00161-2024.gz";
	const std::string OTHER_FILE_2024 = "/pub/data/noaa/2024/720534-94075-2024.gz";
	const std::string GUESSED_FILE_2019 = "/pub/data/noaa/2019/720534-00161-2019.gz";

	class FakeTransport : public Transport
	{
	public:
		std::map<std::string, std::string> files;
		int retrieved = 0;

	protected:
		std::string retrieve(const std::string& filename) override
		{
			retrieved++;
			auto it = files.find(filename);
			if (it == files.end())
				throw TransportError{filename, "no such file"};
			return it->second;
		}
	};

	struct CerrCapture
	{
		std::ostringstream buffer;
		std::streambuf* old;

		CerrCapture() : old{std::cerr.rdbuf(buffer.rdbuf())} {}
		~CerrCapture() { std::cerr.rdbuf(old); }
	};

	bool near(double a, double b)
	{
		return std::abs(a - b) < 1e-9;
	}

	std::string line(const std::string& datetime, const std::string& temperature)
	{
		std::string l = LINE;
		l.replace(15, 12, datetime);
		l.replace(87, 5, temperature);
		return l;
	}

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

	FileInventory inventory(const std::string& wban, int year)
	{
		FileInventory f;
		f.usafId = "720534";
		f.wbanId = wban;
		f.year = year;
		f.monthlyCounts.fill(720);
		f.count = 8640;
		f.nZeroMonths = 0;
		f.quality = "high";
		return f;
	}

	InMemoryMetadataStore buildStore()
	{
		InMemoryMetadataStore store;
		StationMetadata s;
		s.usafId = "720534";
		s.wbanIds = {"99999", "00161"};
		s.recentWbanId = "00161";
		s.name = "ERIE MUNICIPAL AIRPORT";
		s.latitude = 40.017;
		s.longitude = -105.05;
		s.state = "CO";
		store.addStation(s);
		store.addFileInventory(inventory("00161", 2025));
		store.addFileInventory(inventory("94075", 2024));
		store.addFileInventory(inventory("00161", 2024));
		return store;
	}

	FakeTransport buildTransport()
	{
		FakeTransport transport;
		// out of order, with DOS line endings
		transport.files[FILE_2025] = gzip(
			line("202501010105", "+0100") + "\r\n" +
			line("202501010001", "+0010") + "\r\n" +
			line("202501010033", "+0020") + "\r\n");
		transport.files[FILE_2024] = gzip(line("202412311200", "+0050") + "\n");
		transport.files[OTHER_FILE_2024] = gzip(
			line("202412311200", "+0060") + "\n" +
			line("202406010000", "+0250") + "\n");
		return transport;
	}

	template<typename Error, typename F>
	bool throws(F&& f)
	{
		try {
			f();
		} catch (const Error&) {
			return true;
		}
		return false;
	}

	void testFilenames()
	{
		InMemoryMetadataStore store = buildStore();
		Station station{"720534", store};
		assert(station.getMetadata().name == "ERIE MUNICIPAL AIRPORT");
		assert(station.getFilenames(2025) == std::vector<std::string>{FILE_2025});
		assert(station.getFilenames(std::nullopt) == (std::vector<std::string>{FILE_2024, OTHER_FILE_2024, FILE_2025}));
		assert(station.getYears() == (std::vector<int>{2024, 2025}));
		assert(station.qualityReport(2024).size() == 2);
		assert(station.qualityReport(std::nullopt).size() == 3);
		std::cout << "filenames passed" << std::endl;
	}

	void testMissingYear()
	{
		InMemoryMetadataStore store = buildStore();
		Station station{"720534", store};
		{
			CerrCapture capture;
			assert(station.getFilenames(2019) == std::vector<std::string>{GUESSED_FILE_2019});
			assert(capture.buffer.str().find("2019") != std::string::npos);
		}

		station.setFilenameGuessing(false);
		{
			CerrCapture capture;
			assert(station.getFilenames(2019).empty());
			assert(capture.buffer.str().find("2019") != std::string::npos);
		}
		std::cout << "missing year passed" << std::endl;
	}

	void testUnknownStation()
	{
		InMemoryMetadataStore store = buildStore();
		assert(throws<ConfigurationError>([&store]() { Station("123456", store); }));
		std::cout << "unknown station passed" << std::endl;
	}

	void testFetchRecords()
	{
		InMemoryMetadataStore store = buildStore();
		Station station{"720534", store};
		FakeTransport transport = buildTransport();

		std::vector<IsdRecord> records = station.fetchRecords({2025}, transport);
		assert(records.size() == 3);
		assert(records[0].getDateTime() == sys_days{2025_y/January/1} + minutes{1});
		assert(records[1].getDateTime() == sys_days{2025_y/January/1} + minutes{33});
		assert(records[2].getDateTime() == sys_days{2025_y/January/1} + minutes{65});
		assert(records[2].getControl().qcProcessName == "V020");

		records = station.fetchRecords({2024, 2025}, transport);
		assert(records.size() == 6);
		assert(records[0].getDateTime() == sys_days{2024_y/June/1});
		// same time in two files: the order of the files is kept
		assert(near(*records[1].getMandatory().airTemperature.temperatureC, 5.));
		assert(near(*records[2].getMandatory().airTemperature.temperatureC, 6.));
		std::cout << "fetch records passed" << std::endl;
	}

	void testFormatErrorLocation()
	{
		InMemoryMetadataStore store = buildStore();
		Station station{"720534", store};
		FakeTransport transport;
		transport.files[FILE_2025] = gzip(line("202501010001", "+0010") + "\n" + line("202501310115", "+00A0") + "\n");

		bool thrown = false;
		try {
			station.fetchRecords({2025}, transport);
		} catch (const FormatError& e) {
			thrown = true;
			assert(e.getFilename() && *e.getFilename() == FILE_2025);
			assert(e.getLineNumber() && *e.getLineNumber() == 2);
			assert(std::string{e.what()}.find("line 2") != std::string::npos);
		}
		assert(thrown);
		std::cout << "format error location passed" << std::endl;
	}

	void testEmptyLines()
	{
		std::istringstream input{line("202501010001", "+0010") + "\n\n" + line("202501010033", "+0020") + "\n"};
		CerrCapture capture;
		std::vector<IsdRecord> records = Station::readRecords(input, "local.isd");
		assert(records.size() == 2);
		assert(capture.buffer.str().find("local.isd, line 2") != std::string::npos);
		std::cout << "empty lines passed" << std::endl;
	}

	void testTransportErrors()
	{
		InMemoryMetadataStore store = buildStore();
		Station station{"720534", store};
		FakeTransport transport = buildTransport();

		bool thrown = false;
		try {
			CerrCapture capture;
			station.fetchRecords({2019}, transport);
		} catch (const TransportError& e) {
			thrown = true;
			assert(e.getFilename() == GUESSED_FILE_2019);
		}
		assert(thrown);

		transport.files[FILE_2025] = "this is not a gzip archive";
		assert(throws<TransportError>([&]() { station.fetchRecords({2025}, transport); }));

		transport.files["/pub/data/noaa/isd-history.txt"] = "plain text";
		auto plain = transport.open("/pub/data/noaa/isd-history.txt");
		std::string content;
		std::getline(*plain, content);
		assert(content == "plain text");
		std::cout << "transport errors passed" << std::endl;
	}

	void testTableColumns()
	{
		InMemoryMetadataStore store = buildStore();
		Station station{"720534", store};
		FakeTransport transport = buildTransport();

		FetchOptions options;
		options.selection = FieldSelection{{"air_temperature"}};
		options.includeQualityCodes = false;
		ObservationTable table = station.fetchTable({2025}, options, transport);
		assert(table.getColumnNames() == (std::vector<std::string>{
			"air_temperature.temperature_c", "air_temperature.temperature_f"
		}));
		assert(table.size() == 3);
		assert(near(std::get<double>(table.get(0, "air_temperature.temperature_f")), 33.8));

		options.temperatureScale = FetchOptions::TemperatureScale::FAHRENHEIT;
		table = station.fetchTable({2025}, options, transport);
		assert(table.getColumnNames() == std::vector<std::string>{"air_temperature.temperature_f"});

		FetchOptions control;
		control.selection = FieldSelection{{"wind"}};
		control.includeControl = true;
		table = station.fetchTable({2025}, control, transport);
		assert(table.getColumnNames().front() == "total_variable_characters");
		assert(table.hasColumn("qc_process_name"));
		assert(!table.hasColumn("datetime"));
		assert(table.columnCount() == 15);
		std::cout << "table columns passed" << std::endl;
	}

	void testDisplayTimezone()
	{
		InMemoryMetadataStore store = buildStore();
		Station station{"720534", store};
		FakeTransport transport = buildTransport();

		FetchOptions options;
		options.selection = FieldSelection{{"air_temperature"}};
		options.temperatureScale = FetchOptions::TemperatureScale::CELSIUS;
		options.includeQualityCodes = false;
		options.period = Period::hours(1);
		options.timezone = "America/New_York";
		ObservationTable table = station.fetchTable({2025}, options, transport);

		// buckets and stored times stay in UTC
		assert(table.getDisplayTimezone().getName() == "America/New_York");
		assert(table.size() == 2);
		assert(table.getTime(0) == sys_days{2025_y/January/1} + hours{1});
		assert(table.getTime(1) == sys_days{2025_y/January/1} + hours{2});
		assert(near(std::get<double>(table.get(0, "air_temperature.temperature_c")), 3.3));

		std::ostringstream csv;
		table.writeCsv(csv);
		const std::string out = csv.str();
		assert(out.find("datetime,air_temperature.temperature_c\n") == 0);
		assert(out.find("\n2024-12-31 20:00:00-0500,3.3\n") != std::string::npos);
		assert(out.find("\n2024-12-31 21:00:00-0500,9.5\n") != std::string::npos);

		options.timezone = "UTC";
		table = station.fetchTable({2025}, options, transport);
		assert(table.getDisplayTimezone().getName() == "UTC");
		assert(table.getTime(0) == sys_days{2025_y/January/1} + hours{1});
		std::ostringstream utc;
		table.writeCsv(utc);
		assert(utc.str().find("\n2025-01-01 01:00:00+0000,3.3\n") != std::string::npos);
		std::cout << "display timezone passed" << std::endl;
	}

	void testValidationBeforeDownload()
	{
		InMemoryMetadataStore store = buildStore();
		Station station{"720534", store};
		FakeTransport transport = buildTransport();

		FetchOptions badField;
		badField.selection = FieldSelection{{"humidity"}};
		assert(throws<ConfigurationError>([&]() { station.fetchTable({2025}, badField, transport); }));

		FetchOptions badRollup;
		badRollup.period = Period::parse("MS");
		badRollup.rollup = RollupPolicy::MIDPOINT;
		assert(throws<ConfigurationError>([&]() { station.fetchTable({2025}, badRollup, transport); }));

		FetchOptions oddPeriod;
		oddPeriod.period = Period::parse("3s");
		oddPeriod.rollup = RollupPolicy::MIDPOINT;
		assert(throws<ConfigurationError>([&]() { station.fetchTable({2025}, oddPeriod, transport); }));

		FetchOptions badTimezone;
		badTimezone.timezone = "Mars/Olympus_Mons";
		assert(throws<ConfigurationError>([&]() { station.fetchTable({2025}, badTimezone, transport); }));

		assert(transport.retrieved == 0);
		assert(throws<ConfigurationError>([]() { FetchOptions::parseTemperatureScale("K"); }));
		assert(FetchOptions::parseTemperatureScale("c") == FetchOptions::TemperatureScale::CELSIUS);
		std::cout << "validation before download passed" << std::endl;
	}

	void testRollup()
	{
		InMemoryMetadataStore store = buildStore();
		Station station{"720534", store};
		FakeTransport transport = buildTransport();

		FetchOptions options;
		options.selection = FieldSelection{{"air_temperature", "wind"}};
		options.temperatureScale = FetchOptions::TemperatureScale::CELSIUS;
		options.period = Period::hours(1);
		ObservationTable table = station.fetchTable({2025}, options, transport);

		// only the columns that can be averaged are kept
		assert(table.getColumnNames() == (std::vector<std::string>{
			"wind.speed_rate", "air_temperature.temperature_c"
		}));
		assert(table.size() == 2);
		assert(table.getTime(0) == sys_days{2025_y/January/1} + hours{1});
		assert(table.getTime(1) == sys_days{2025_y/January/1} + hours{2});
		assert(near(std::get<double>(table.get(0, "air_temperature.temperature_c")), 3.3));
		assert(near(std::get<double>(table.get(1, "air_temperature.temperature_c")), 9.5));
		assert(near(std::get<double>(table.get(0, "wind.speed_rate")), 1.5));

		options.rollup = RollupPolicy::STARTING;
		options.upsampleFirst = false;
		table = station.fetchTable({2025}, options, transport);
		assert(table.getTime(0) == sys_days{2025_y/January/1});
		assert(near(std::get<double>(table.get(0, "air_temperature.temperature_c")), 1.5));
		assert(near(std::get<double>(table.get(1, "air_temperature.temperature_c")), 10.));
		std::cout << "rollup passed" << std::endl;
	}
}

int main()
{
	testFilenames();
	testMissingYear();
	testUnknownStation();
	testFetchRecords();
	testFormatErrorLocation();
	testEmptyLines();
	testTransportErrors();
	testTableColumns();
	testValidationBeforeDownload();
	testDisplayTimezone();
	testRollup();
}
