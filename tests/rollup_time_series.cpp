#undef NDEBUG
#include <cassert>
#include <cmath>
#include <chrono>
#include <iostream>
#include <vector>
#include <utility>
#include <optional>

#include <date/date.h>

#include "../src/errors.h"
#include "../src/rollup/period.h"
#include "../src/rollup/time_series.h"
#include "../src/rollup/rollup.h"

using namespace meteoisd;
using namespace date;
using namespace std::chrono;

namespace
{
	const sys_seconds MIDNIGHT = sys_days{2025_y/January/1};

	bool near(double a, double b)
	{
		return std::abs(a - b) < 1e-9;
	}

	template<typename F>
	bool throwsConfigurationError(F&& f)
	{
		try {
			f();
		} catch (const ConfigurationError&) {
			return true;
		}
		return false;
	}

	TimeSeries series(const std::vector<std::pair<minutes, std::optional<double>>>& samples)
	{
		TimeSeries s{{"value"}};
		for (const auto& sample : samples)
			s.append(MIDNIGHT + sample.first, {sample.second});
		return s;
	}

	TimeSeries reference()
	{
		return series({{minutes{1}, 1.}, {minutes{33}, 2.}, {minutes{65}, 10.}});
	}

	void check(const TimeSeries& result, const std::vector<std::pair<minutes, std::optional<double>>>& expected)
	{
		assert(result.size() == expected.size());
		for (std::size_t i = 0 ; i < expected.size() ; i++) {
			assert(result.getTime(i) == MIDNIGHT + expected[i].first);
			const auto& value = result.get(i, 0);
			if (expected[i].second) {
				assert(value);
				assert(near(*value, *expected[i].second));
			} else {
				assert(!value);
			}
		}
	}

	void testPeriod()
	{
		Period p = Period::parse("h");
		assert(p.getUnit() == Period::Unit::HOUR && p.getCount() == 1);
		assert(p.getDuration() == hours{1});
		assert(Period::parse("15min").getDuration() == minutes{15});
		assert(Period::parse("15T").getDuration() == minutes{15});
		assert(Period::parse("30 minutes").getDuration() == minutes{30});
		assert(Period::parse("1 hour").getDuration() == hours{1});
		assert(Period::parse("2D").getDuration() == hours{48});
		assert(Period::parse("15min").toString() == "15min");
		assert(!Period::parse("MS").isFixed());
		assert(!Period::parse("YS").isFixed());
		assert(Period::parse("MS").toString() == "1MS");

		assert(throwsConfigurationError([]() { Period::parse("3 fortnights"); }));
		assert(throwsConfigurationError([]() { Period::parse("W"); }));
		assert(throwsConfigurationError([]() { Period::parse(""); }));
		assert(throwsConfigurationError([]() { Period::parse("0h"); }));
		assert(throwsConfigurationError([]() { Period::parse("MS").getDuration(); }));
		std::cout << "period passed" << std::endl;
	}

	void testPolicies()
	{
		assert(parseRollupPolicy("starting") == RollupPolicy::STARTING);
		assert(parseRollupPolicy("ending") == RollupPolicy::ENDING);
		assert(parseRollupPolicy("midpoint") == RollupPolicy::MIDPOINT);
		assert(parseRollupPolicy("instant") == RollupPolicy::INSTANT);
		assert(toString(RollupPolicy::MIDPOINT) == "midpoint");
		assert(throwsConfigurationError([]() { parseRollupPolicy("average"); }));
		std::cout << "policies passed" << std::endl;
	}

	void testUpsample()
	{
		TimeSeries u = upsample(reference());
		// one row per minute, from 00:01 to 01:05 included
		assert(u.size() == 65);
		assert(u.getTime(0) == MIDNIGHT + minutes{1});
		assert(u.getTime(64) == MIDNIGHT + minutes{65});
		assert(near(*u.get(0, 0), 1.));
		assert(near(*u.get(16, 0), 1.5));
		assert(near(*u.get(32, 0), 2.));
		assert(near(*u.get(59, 0), 8.75));
		assert(near(*u.get(64, 0), 10.));
		std::cout << "upsample passed" << std::endl;
	}

	void testUpsampleGap()
	{
		TimeSeries u = upsample(series({{minutes{0}, 1.}, {minutes{180}, 4.}}));
		assert(u.size() == 181);
		assert(near(*u.get(60, 0), 2.));
		assert(!u.get(61, 0));
		assert(!u.get(119, 0));
		assert(near(*u.get(120, 0), 3.));
		std::cout << "upsample gap passed" << std::endl;
	}

	void testRollupsWithUpsampling()
	{
		Period h = Period::hours(1);
		check(rollupStarting(reference(), h), {{minutes{0}, 3.207627118644068}, {minutes{60}, 9.375}});
		check(rollupEnding(reference(), h), {{minutes{60}, 3.3}, {minutes{120}, 9.5}});
		check(rollupMidpoint(reference(), h), {{minutes{0}, 1.4375}, {minutes{60}, 5.661458333333333}});
		check(rollupInstant(reference(), h), {{minutes{0}, 1.}, {minutes{60}, 8.75}});

		check(rollupStarting(reference(), Period::parse("15min")), {
			{minutes{0}, 1.203125}, {minutes{15}, 1.65625}, {minutes{30}, 3.0875},
			{minutes{45}, 6.75}, {minutes{60}, 9.375}
		});
		std::cout << "rollups with upsampling passed" << std::endl;
	}

	void testRollupsWithoutUpsampling()
	{
		Period h = Period::hours(1);
		check(rollupStarting(reference(), h, false), {{minutes{0}, 1.5}, {minutes{60}, 10.}});
		check(rollupEnding(reference(), h, false), {{minutes{60}, 1.5}, {minutes{120}, 10.}});
		check(rollupMidpoint(reference(), h, false), {{minutes{0}, 1.}, {minutes{60}, 6.}});
		check(rollupInstant(reference(), h, false), {{minutes{0}, 1.}, {minutes{60}, 10.}});

		check(rollup(reference(), h, RollupPolicy::ENDING, false), {{minutes{60}, 1.5}, {minutes{120}, 10.}});
		std::cout << "rollups without upsampling passed" << std::endl;
	}

	void testEmptyBuckets()
	{
		TimeSeries s = series({{minutes{1}, 1.}, {minutes{70}, std::nullopt}, {minutes{185}, 4.}});
		check(rollupStarting(s, Period::hours(1), false), {
			{minutes{0}, 1.}, {minutes{60}, std::nullopt}, {minutes{120}, std::nullopt}, {minutes{180}, 4.}
		});
		check(rollupInstant(s, Period::hours(1), false), {
			{minutes{0}, 1.}, {minutes{60}, std::nullopt}, {minutes{120}, std::nullopt}, {minutes{180}, 4.}
		});
		assert(rollupStarting(TimeSeries{{"value"}}, Period::hours(1)).empty());
		std::cout << "empty buckets passed" << std::endl;
	}

	void testEdgeSample()
	{
		// a sample on an edge opens its bucket on the left, closes it on the right
		TimeSeries s = series({{minutes{60}, 1.}, {minutes{90}, 3.}});
		check(rollupStarting(s, Period::hours(1), false), {{minutes{60}, 2.}});
		check(rollupEnding(s, Period::hours(1), false), {{minutes{60}, 1.}, {minutes{120}, 3.}});
		std::cout << "edge sample passed" << std::endl;
	}

	void testUnsortedInput()
	{
		TimeSeries s = series({{minutes{65}, 10.}, {minutes{1}, 1.}, {minutes{33}, 2.}});
		assert(!s.isSorted());
		check(rollupEnding(s, Period::hours(1)), {{minutes{60}, 3.3}, {minutes{120}, 9.5}});
		check(rollupInstant(s, Period::hours(1), false), {{minutes{0}, 1.}, {minutes{60}, 10.}});

		// simultaneous samples keep their order
		TimeSeries t = series({{minutes{5}, 2.}, {minutes{5}, 7.}});
		check(rollupInstant(t, Period::hours(1), false), {{minutes{0}, 2.}});
		std::cout << "unsorted input passed" << std::endl;
	}

	void testCalendarPeriods()
	{
		TimeSeries s{{"value"}};
		s.append(sys_days{2025_y/January/15}, {1.});
		s.append(sys_days{2025_y/March/2} + hours{6}, {3.});
		TimeSeries monthly = rollupStarting(s, Period::parse("MS"), false);
		assert(monthly.size() == 3);
		assert(monthly.getTime(0) == sys_days{2025_y/January/1});
		assert(monthly.getTime(1) == sys_days{2025_y/February/1});
		assert(monthly.getTime(2) == sys_days{2025_y/March/1});
		assert(near(*monthly.get(0, 0), 1.));
		assert(!monthly.get(1, 0));
		assert(near(*monthly.get(2, 0), 3.));

		TimeSeries yearly = rollupEnding(s, Period::parse("YS"), false);
		assert(yearly.size() == 1);
		assert(yearly.getTime(0) == sys_days{2026_y/January/1});

		assert(throwsConfigurationError([&s]() { rollupMidpoint(s, Period::parse("MS")); }));
		assert(throwsConfigurationError([&s]() { rollup(s, Period::parse("YS"), RollupPolicy::MIDPOINT); }));
		std::cout << "calendar periods passed" << std::endl;
	}

	void testMidpointHalfPeriod()
	{
		TimeSeries s{{"value"}};
		s.append(MIDNIGHT, {1.});
		s.append(MIDNIGHT + seconds{1}, {2.});
		s.append(MIDNIGHT + seconds{2}, {3.});

		// half a second cannot be represented
		assert(throwsConfigurationError([&s]() { rollupMidpoint(s, Period::parse("1s"), false); }));
		assert(throwsConfigurationError([&s]() { rollupMidpoint(s, Period::parse("3s"), false); }));
		assert(throwsConfigurationError([]() { checkMidpointPeriod(Period::parse("15s")); }));
		checkMidpointPeriod(Period::parse("1min"));

		TimeSeries r = rollupMidpoint(s, Period::parse("2s"), false);
		assert(r.size() == 2);
		assert(r.getTime(0) == MIDNIGHT);
		assert(r.getTime(1) == MIDNIGHT + seconds{2});
		assert(near(*r.get(0, 0), 1.));
		assert(near(*r.get(1, 0), 2.5));
		std::cout << "midpoint half period passed" << std::endl;
	}

	void testSeveralColumns()
	{
		TimeSeries s{{"a", "b"}};
		s.append(MIDNIGHT + minutes{10}, {1., std::nullopt});
		s.append(MIDNIGHT + minutes{20}, {3., 5.});
		TimeSeries r = rollupStarting(s, Period::hours(1), false);
		assert(r.getColumnNames().size() == 2);
		assert(near(*r.get(0, "a"), 2.));
		assert(near(*r.get(0, "b"), 5.));
		std::cout << "several columns passed" << std::endl;
	}
}

int main()
{
	testPeriod();
	testPolicies();
	testUpsample();
	testUpsampleGap();
	testRollupsWithUpsampling();
	testRollupsWithoutUpsampling();
	testEmptyBuckets();
	testEdgeSample();
	testUnsortedInput();
	testCalendarPeriods();
	testMidpointHalfPeriod();
	testSeveralColumns();
}
