/**
 * @file isd_record.cpp
 * @brief Implementation of the IsdRecord class and of the ISD observation groups
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

#include <utility>

#include "isd_record.h"

namespace meteoisd
{

std::optional<double> TemperatureObservation::temperatureF() const
{
	if (!temperatureC)
		return std::nullopt;
	return *temperatureC * 1.8 + 32;
}

IsdRecord::IsdRecord(ControlData control, MandatoryData mandatory) :
	_control{std::move(control)},
	_mandatory{std::move(mandatory)}
{
}

}
