/**
 * @file errors.h
 * @brief Definition of the exceptions thrown while decoding and fetching ISD data
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

#ifndef ERRORS_H
#define ERRORS_H

#include <cstddef>
#include <string>
#include <optional>
#include <stdexcept>

namespace meteoisd
{

/**
 * @brief Raised when a raw ISD line does not conform to the fixed-width
 * layout (too short, malformed identifier, invalid date, non-numeric value
 * in a numeric field, etc.)
 *
 * The parser only knows about the line it is given, the fetcher rethrows the
 * error with the name of the file and the line number once it knows them.
 */
class FormatError : public std::runtime_error
{
public:
	explicit FormatError(const std::string& reason);

	/**
	 * @brief Attach the location of a line to an error raised while parsing it
	 *
	 * @param cause The error raised by the parser
	 * @param filename The file the line comes from
	 * @param lineNumber The 1-based position of the line in the file
	 */
	FormatError(const FormatError& cause, const std::string& filename, std::size_t lineNumber);

	inline const std::string& getReason() const
	{
		return _reason;
	}

	inline const std::optional<std::string>& getFilename() const
	{
		return _filename;
	}

	inline std::optional<std::size_t> getLineNumber() const
	{
		return _lineNumber;
	}

private:
	std::string _reason;
	std::optional<std::string> _filename;
	std::optional<std::size_t> _lineNumber;
};

/**
 * @brief Raised when the caller asks for something that cannot be done,
 * before any download or parsing takes place
 */
class ConfigurationError : public std::invalid_argument
{
public:
	using std::invalid_argument::invalid_argument;
};

/**
 * @brief Raised by a transport when a file cannot be retrieved or
 * decompressed
 */
class TransportError : public std::runtime_error
{
public:
	TransportError(const std::string& filename, const std::string& reason);

	inline const std::string& getFilename() const
	{
		return _filename;
	}

private:
	std::string _filename;
};

}

#endif /* ERRORS_H */
