/**
 * @file observation_fields.h
 * @brief Definition of the schema of the columns extracted from ISD records
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

#ifndef OBSERVATION_FIELDS_H
#define OBSERVATION_FIELDS_H

#include <string>
#include <vector>
#include <functional>

#include "../isd/isd_record.h"
#include "observation_table.h"

namespace meteoisd
{

/**
 * @brief A column that can be extracted from ISD records
 */
struct ObservationField
{
	//! The observation group, empty for control fields
	std::string group;
	std::string name;
	//! Whether the values of the field can be averaged
	bool aggregable;
	std::function<Cell(const IsdRecord&)> extract;

	/**
	 * @brief Get the name of the column: "group.name" for observation
	 * fields, "name" for control fields
	 */
	std::string getColumnName() const;
};

/**
 * @brief Get the observation groups of the mandatory data section, in the
 * order of the record
 */
const std::vector<std::string>& getObservationGroups();

/**
 * @brief Get all the fields of the mandatory data section, group by group,
 * in the order of the record, the derived temperature_f field coming after
 * the stored fields of its group
 */
const std::vector<ObservationField>& getObservationFields();

/**
 * @brief Get the fields of the control data section, except the observation
 * time which is used as the index of tables
 */
const std::vector<ObservationField>& getControlFields();

bool isObservationGroup(const std::string& group);
bool isObservationField(const std::string& group, const std::string& name);

}

#endif /* OBSERVATION_FIELDS_H */
