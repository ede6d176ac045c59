/**
 * @file field_selection.h
 * @brief Definition of the FieldSelection class
 * @author Laurent Georget
 * @date 2026-03-05
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

#ifndef FIELD_SELECTION_H
#define FIELD_SELECTION_H

#include <string>
#include <vector>
#include <set>
#include <map>
#include <optional>

#include "observation_fields.h"

namespace meteoisd
{

/**
 * @brief Choose the observation fields to output
 *
 * Fields are chosen either by group ("wind", "air_temperature", etc.) or,
 * more finely, with include and exclude maps from a group to a set of fields
 * of that group, an empty set standing for the whole group. When include or
 * exclude maps are given, the list of groups is ignored. A field both
 * included and excluded is excluded.
 *
 * The default selection selects all the fields.
 */
class FieldSelection
{
public:
	using FieldMap = std::map<std::string, std::set<std::string>>;

	FieldSelection() = default;

	/**
	 * @brief Select whole groups of fields, all of them if \a groups is
	 * empty
	 */
	explicit FieldSelection(std::vector<std::string> groups);

	/**
	 * @brief Select some fields of a group
	 * @param fields The fields to select, empty to select the whole group
	 */
	FieldSelection& include(const std::string& group, const std::set<std::string>& fields = {});

	/**
	 * @brief Remove some fields of a group from the selection
	 * @param fields The fields to remove, empty to remove the whole group
	 */
	FieldSelection& exclude(const std::string& group, const std::set<std::string>& fields = {});

	/**
	 * @brief Parse a field specification, "group" or "group.field", and
	 * include or exclude it
	 */
	FieldSelection& addFieldSpec(const std::string& spec, bool excluded);

	/**
	 * @brief Check that all the groups and fields mentioned exist
	 * @throw ConfigurationError If a group or a field is unknown
	 */
	void validate() const;

	bool isSelected(const std::string& group, const std::string& field) const;

	/**
	 * @brief Get the selected fields, in the order of the schema
	 * @throw ConfigurationError If a group or a field is unknown
	 */
	std::vector<const ObservationField*> resolve() const;

private:
	std::vector<std::string> _groups;
	std::optional<FieldMap> _include;
	std::optional<FieldMap> _exclude;

	static void validate(const FieldMap& fields);
	static bool matches(const FieldMap& fields, const std::string& group, const std::string& field);
};

}

#endif /* FIELD_SELECTION_H */
