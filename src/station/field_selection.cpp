/**
 * @file field_selection.cpp
 * @brief Implementation of the FieldSelection class
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

#include <string>
#include <vector>
#include <set>
#include <map>
#include <algorithm>
#include <utility>

#include "../errors.h"
#include "observation_fields.h"
#include "field_selection.h"

namespace meteoisd
{

FieldSelection::FieldSelection(std::vector<std::string> groups) :
	_groups{std::move(groups)}
{
}

namespace
{
	/**
	 * An empty set of fields stands for the whole group, adding fields to
	 * it does not restrict it
	 */
	void merge(FieldSelection::FieldMap& map, const std::string& group, const std::set<std::string>& fields)
	{
		auto it = map.find(group);
		if (it == map.end())
			map.emplace(group, fields);
		else if (fields.empty())
			it->second.clear();
		else if (!it->second.empty())
			it->second.insert(fields.begin(), fields.end());
	}
}

FieldSelection& FieldSelection::include(const std::string& group, const std::set<std::string>& fields)
{
	if (!_include)
		_include.emplace();
	merge(*_include, group, fields);
	return *this;
}

FieldSelection& FieldSelection::exclude(const std::string& group, const std::set<std::string>& fields)
{
	if (!_exclude)
		_exclude.emplace();
	merge(*_exclude, group, fields);
	return *this;
}

FieldSelection& FieldSelection::addFieldSpec(const std::string& spec, bool excluded)
{
	std::string::size_type dot = spec.find('.');
	std::string group = spec.substr(0, dot);
	std::set<std::string> fields;
	if (dot != std::string::npos)
		fields.insert(spec.substr(dot + 1));
	return excluded ? exclude(group, fields) : include(group, fields);
}

void FieldSelection::validate(const FieldMap& fields)
{
	for (const auto& entry : fields) {
		if (!isObservationGroup(entry.first))
			throw ConfigurationError{"Unknown observation group '" + entry.first + "'"};
		for (const std::string& field : entry.second) {
			if (!isObservationField(entry.first, field))
				throw ConfigurationError{"Unknown field '" + field + "' in observation group '" + entry.first + "'"};
		}
	}
}

void FieldSelection::validate() const
{
	for (const std::string& group : _groups) {
		if (!isObservationGroup(group))
			throw ConfigurationError{"Unknown observation group '" + group + "'"};
	}
	if (_include)
		validate(*_include);
	if (_exclude)
		validate(*_exclude);
}

bool FieldSelection::matches(const FieldMap& fields, const std::string& group, const std::string& field)
{
	auto it = fields.find(group);
	return it != fields.end() && (it->second.empty() || it->second.count(field));
}

bool FieldSelection::isSelected(const std::string& group, const std::string& field) const
{
	if (_include || _exclude) {
		if (_exclude && matches(*_exclude, group, field))
			return false;
		return !_include || matches(*_include, group, field);
	}

	return _groups.empty() || std::find(_groups.cbegin(), _groups.cend(), group) != _groups.cend();
}

std::vector<const ObservationField*> FieldSelection::resolve() const
{
	validate();

	std::vector<const ObservationField*> selected;
	for (const ObservationField& field : getObservationFields()) {
		if (isSelected(field.group, field.name))
			selected.push_back(&field);
	}
	return selected;
}

}
