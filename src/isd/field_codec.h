/**
 * @file field_codec.h
 * @brief Definition of the decoding functions for ISD fixed-width fields
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

#ifndef FIELD_CODEC_H
#define FIELD_CODEC_H

#include <cstddef>
#include <string>
#include <string_view>
#include <optional>
#include <variant>

namespace meteoisd
{

namespace field_codec
{

/**
 * @brief The value of a field once decoded: either the text of the field
 * or, if a scaling factor has been applied, a number
 */
using FieldValue = std::variant<std::string, double>;

/**
 * @brief Tell whether a raw field holds the "missing value" sentinel
 *
 * ISD marks missing values by filling the field with 9s, optionally preceded
 * by a sign. The width of the field does not matter.
 *
 * @param raw The raw content of the field, surrounding blanks are ignored
 * @return true if, and only if, the field is a (signed) run of 9s
 */
bool isMissing(std::string_view raw);

/**
 * @brief Decode a raw field
 *
 * The missing value rule takes precedence over anything else: "+9999" is
 * missing even with a scaling factor of 10.
 *
 * @param raw The raw content of the field
 * @param scalingFactor The value the number must be divided by, 1 to keep
 * the text verbatim
 * @return Nothing if the value is missing, the trimmed text if
 * \a scalingFactor is 1, the scaled number otherwise
 * @throw FormatError If the field must be scaled but is not a number
 */
std::optional<FieldValue> decode(std::string_view raw, double scalingFactor = 1);

/**
 * @brief Decode a numeric field and divide it by its scaling factor
 * @throw FormatError If the field is not a number
 */
std::optional<double> decodeScaled(std::string_view raw, double scalingFactor);

/**
 * @brief Decode an integral field (an optional sign and digits only)
 * @throw FormatError If the field is not an integer
 */
std::optional<int> decodeInteger(std::string_view raw);

/**
 * @brief Decode a textual field
 * @param maxLength The maximum length of the trimmed text
 * @throw FormatError If the text is longer than \a maxLength
 */
std::optional<std::string> decodeText(std::string_view raw, std::size_t maxLength);

/**
 * @brief Remove leading and trailing blanks
 */
std::string_view trim(std::string_view raw);

}

}

#endif /* FIELD_CODEC_H */
