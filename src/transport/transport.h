/**
 * @file transport.h
 * @brief Definition of the Transport abstract class
 * @author Laurent Georget
 * @date 2026-02-26
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

#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <string>
#include <istream>
#include <memory>

namespace meteoisd
{

/**
 * @brief A way to retrieve files from the NOAA ISD archive
 *
 * Filenames are paths relative to the root of the archive, such as
 * "/pub/data/noaa/2018/720534-00161-2018.gz". Files whose name ends in ".gz"
 * or ".z" are decompressed on the fly, other files are returned as is.
 */
class Transport
{
public:
	virtual ~Transport() = default;

	/**
	 * @brief Retrieve a file and get a stream to read its (decompressed)
	 * content
	 *
	 * @param filename The path of the file in the archive
	 * @return A stream on the content of the file
	 * @throw TransportError If the file cannot be retrieved or is not
	 * a valid gzip archive
	 */
	std::unique_ptr<std::istream> open(const std::string& filename);

protected:
	/**
	 * @brief Get the raw content of a file
	 * @throw TransportError If the file cannot be retrieved
	 */
	virtual std::string retrieve(const std::string& filename) = 0;

	static bool isCompressed(const std::string& filename);

	/**
	 * @brief Uncompress the content of a gzip archive
	 * @throw TransportError If the archive is corrupted
	 */
	static std::string decompress(const std::string& filename, const std::string& content);
};

}

#endif /* TRANSPORT_H */
