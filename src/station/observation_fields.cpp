/**
 * @file observation_fields.cpp
 * @brief Implementation of the schema of the columns extracted from ISD records
 * @author Laurent Georget
 * @date 2026-03-04
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
#include <optional>
#include <algorithm>

#include "../isd/isd_record.h"
#include "observation_table.h"
#include "observation_fields.h"

namespace meteoisd
{

namespace
{
	Cell cell(const std::optional<int>& value)
	{
		if (value)
			return static_cast<long>(*value);
		return std::monostate{};
	}

	Cell cell(const std::optional<double>& value)
	{
		if (value)
			return *value;
		return std::monostate{};
	}

	Cell cell(const std::optional<std::string>& value)
	{
		if (value)
			return *value;
		return std::monostate{};
	}

	Cell cell(char code)
	{
		return std::string(1, code);
	}

	const MandatoryData& m(const IsdRecord& r)
	{
		return r.getMandatory();
	}

	const ControlData& c(const IsdRecord& r)
	{
		return r.getControl();
	}

	std::vector<ObservationField> temperatureFields(const std::string& group,
		const TemperatureObservation& (*select)(const IsdRecord&))
	{
		return {
			{group, "temperature_c", true,  [select](const IsdRecord& r) { return cell(select(r).temperatureC); }},
			{group, "quality_code",  false, [select](const IsdRecord& r) { return cell(select(r).qualityCode); }},
			{group, "temperature_f", true,  [select](const IsdRecord& r) { return cell(select(r).temperatureF()); }}
		};
	}

	std::vector<ObservationField> buildObservationFields()
	{
		std::vector<ObservationField> fields = {
			{"wind", "direction_angle",        false, [](const IsdRecord& r) { return cell(m(r).wind.directionAngle); }},
			{"wind", "direction_quality_code", false, [](const IsdRecord& r) { return cell(m(r).wind.directionQualityCode); }},
			{"wind", "type_code",              false, [](const IsdRecord& r) { return cell(m(r).wind.typeCode); }},
			{"wind", "speed_rate",             true,  [](const IsdRecord& r) { return cell(m(r).wind.speedRate); }},
			{"wind", "speed_quality_code",     false, [](const IsdRecord& r) { return cell(m(r).wind.speedQualityCode); }},

			{"ceiling", "ceiling_height",             true,  [](const IsdRecord& r) { return cell(m(r).ceiling.ceilingHeight); }},
			{"ceiling", "ceiling_quality_code",       false, [](const IsdRecord& r) { return cell(m(r).ceiling.ceilingQualityCode); }},
			{"ceiling", "ceiling_determination_code", false, [](const IsdRecord& r) { return cell(m(r).ceiling.ceilingDeterminationCode); }},
			{"ceiling", "cavok_code",                 false, [](const IsdRecord& r) { return cell(m(r).ceiling.cavokCode); }},

			{"visibility", "distance",                 true,  [](const IsdRecord& r) { return cell(m(r).visibility.distance); }},
			{"visibility", "distance_quality_code",    false, [](const IsdRecord& r) { return cell(m(r).visibility.distanceQualityCode); }},
			{"visibility", "variability_code",         false, [](const IsdRecord& r) { return cell(m(r).visibility.variabilityCode); }},
			{"visibility", "variability_quality_code", false, [](const IsdRecord& r) { return cell(m(r).visibility.variabilityQualityCode); }}
		};

		auto airTemperature = temperatureFields("air_temperature", [](const IsdRecord& r) -> const TemperatureObservation& {
			return m(r).airTemperature;
		});
		fields.insert(fields.end(), airTemperature.begin(), airTemperature.end());

		auto dewPoint = temperatureFields("dew_point", [](const IsdRecord& r) -> const TemperatureObservation& {
			return m(r).dewPoint;
		});
		fields.insert(fields.end(), dewPoint.begin(), dewPoint.end());

		fields.push_back({"sea_level_pressure", "pressure",     true,  [](const IsdRecord& r) { return cell(m(r).seaLevelPressure.pressure); }});
		fields.push_back({"sea_level_pressure", "quality_code", false, [](const IsdRecord& r) { return cell(m(r).seaLevelPressure.qualityCode); }});
		return fields;
	}

	std::vector<ObservationField> buildControlFields()
	{
		return {
			{"", "total_variable_characters", false, [](const IsdRecord& r) { return cell(std::optional<int>{c(r).totalVariableCharacters}); }},
			{"", "usaf_id",                   false, [](const IsdRecord& r) { return Cell{c(r).usafId}; }},
			{"", "wban_id",                   false, [](const IsdRecord& r) { return Cell{c(r).wbanId}; }},
			{"", "data_source_flag",          false, [](const IsdRecord& r) { return cell(c(r).dataSourceFlag); }},
			{"", "latitude",                  false, [](const IsdRecord& r) { return cell(c(r).latitude); }},
			{"", "longitude",                 false, [](const IsdRecord& r) { return cell(c(r).longitude); }},
			{"", "report_type_code",          false, [](const IsdRecord& r) { return cell(c(r).reportTypeCode); }},
			{"", "elevation",                 false, [](const IsdRecord& r) { return cell(c(r).elevation); }},
			{"", "call_letter_id",            false, [](const IsdRecord& r) { return cell(c(r).callLetterId); }},
			{"", "qc_process_name",           false, [](const IsdRecord& r) { return Cell{c(r).qcProcessName}; }}
		};
	}
}

std::string ObservationField::getColumnName() const
{
	return group.empty() ? name : group + "." + name;
}

const std::vector<std::string>& getObservationGroups()
{
	static const std::vector<std::string> groups = {
		"wind", "ceiling", "visibility", "air_temperature", "dew_point", "sea_level_pressure"
	};
	return groups;
}

const std::vector<ObservationField>& getObservationFields()
{
	static const std::vector<ObservationField> fields = buildObservationFields();
	return fields;
}

const std::vector<ObservationField>& getControlFields()
{
	static const std::vector<ObservationField> fields = buildControlFields();
	return fields;
}

bool isObservationGroup(const std::string& group)
{
	const auto& groups = getObservationGroups();
	return std::find(groups.cbegin(), groups.cend(), group) != groups.cend();
}

bool isObservationField(const std::string& group, const std::string& name)
{
	const auto& fields = getObservationFields();
	return std::any_of(fields.cbegin(), fields.cend(), [&](const ObservationField& f) {
		return f.group == group && f.name == name;
	});
}

}
