/**
 * @file errors.cpp
 * @brief Implementation of the exceptions thrown while decoding and fetching ISD data
 * @author Laurent Georget
 * @date 2026-02-16
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

#include "errors.h"

namespace meteoisd
{

FormatError::FormatError(const std::string& reason) :
	std::runtime_error{reason},
	_reason{reason}
{
}

FormatError::FormatError(const FormatError& cause, const std::string& filename, std::size_t lineNumber) :
	std::runtime_error{filename + ", line " + std::to_string(lineNumber) + ": " + cause.getReason()},
	_reason{cause.getReason()},
	_filename{filename},
	_lineNumber{lineNumber}
{
}

TransportError::TransportError(const std::string& filename, const std::string& reason) :
	std::runtime_error{"Cannot retrieve " + filename + ": " + reason},
	_filename{filename}
{
}

}
