/**
 * @file isd_record.h
 * @brief Definition of the IsdRecord class and of the ISD observation groups
 * @author Laurent Georget
 * @date 2026-02-17
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

#ifndef ISD_RECORD_H
#define ISD_RECORD_H

#include <string>
#include <vector>
#include <optional>

#include <date/date.h>

namespace meteoisd
{

/**
 * @brief The control data section of an ISD record: station identifiers,
 * observation time and report metadata
 */
struct ControlData
{
	//! Number of characters in the variable length section following the mandatory section
	int totalVariableCharacters;
	//! Air Force station identifier
	std::string usafId;
	//! NCEI Weather Bureau Army-Navy identifier
	std::string wbanId;
	//! Observation time, always UTC
	date::sys_seconds datetime;
	std::optional<std::string> dataSourceFlag;
	//! Latitude in degrees, negative in the southern hemisphere
	std::optional<double> latitude;
	//! Longitude in degrees, negative in the western hemisphere
	std::optional<double> longitude;
	//! Type of surface observation (FM-12, FM-15, SAO, etc.)
	std::optional<std::string> reportTypeCode;
	//! Elevation relative to mean sea level, in meters
	std::optional<int> elevation;
	std::optional<std::string> callLetterId;
	//! Quality control process applied (V01, V02, V03 or V020)
	std::string qcProcessName;
};

struct WindObservation
{
	//! Angle between true north and the direction the wind blows from, in degrees
	std::optional<int> directionAngle;
	char directionQualityCode;
	//! Character of the observation (N: normal, C: calm, V: variable, etc.)
	std::optional<std::string> typeCode;
	//! Wind speed, in m/s
	std::optional<double> speedRate;
	char speedQualityCode;
};

struct SkyConditionObservation
{
	/**
	 * Height above ground of the lowest cloud layer covering at least 5/8
	 * of the sky, in meters.
	 * An unlimited ceiling is coded as UNLIMITED_CEILING, which is a value,
	 * not a missing observation.
	 */
	std::optional<int> ceilingHeight;
	char ceilingQualityCode;
	std::optional<std::string> ceilingDeterminationCode;
	//! Ceiling And Visibility OK: N or Y
	std::optional<std::string> cavokCode;

	static constexpr int UNLIMITED_CEILING = 22000;

	inline bool isUnlimited() const
	{
		return ceilingHeight && *ceilingHeight == UNLIMITED_CEILING;
	}
};

struct VisibilityObservation
{
	//! Horizontal visibility, in meters, capped at 160000
	std::optional<int> distance;
	char distanceQualityCode;
	//! N: not variable, V: variable
	std::optional<std::string> variabilityCode;
	char variabilityQualityCode;
};

/**
 * @brief An observation of the air temperature or of the dew point
 */
struct TemperatureObservation
{
	//! Temperature, in °C
	std::optional<double> temperatureC;
	char qualityCode;

	/**
	 * @brief Get the temperature in °F
	 * @return The temperature converted to Fahrenheit, or nothing if the
	 * temperature is missing
	 */
	std::optional<double> temperatureF() const;
};

struct PressureObservation
{
	//! Air pressure relative to mean sea level, in hPa
	std::optional<double> pressure;
	char qualityCode;
};

/**
 * @brief The mandatory data section of an ISD record
 */
struct MandatoryData
{
	WindObservation wind;
	SkyConditionObservation ceiling;
	VisibilityObservation visibility;
	TemperatureObservation airTemperature;
	TemperatureObservation dewPoint;
	PressureObservation seaLevelPressure;
};

/**
 * @brief A group from the additional data section, which is not decoded
 * for now
 */
struct AdditionalData
{
};

/**
 * @brief One observation from an ISD file
 *
 * Records are built once from a raw line by the parser and never modified
 * afterwards.
 */
class IsdRecord
{
public:
	IsdRecord(ControlData control, MandatoryData mandatory);

	inline const ControlData& getControl() const
	{
		return _control;
	}

	inline const MandatoryData& getMandatory() const
	{
		return _mandatory;
	}

	inline const std::vector<AdditionalData>& getAdditional() const
	{
		return _additional;
	}

	inline date::sys_seconds getDateTime() const
	{
		return _control.datetime;
	}

private:
	ControlData _control;
	MandatoryData _mandatory;
	std::vector<AdditionalData> _additional;
};

}

#endif /* ISD_RECORD_H */
