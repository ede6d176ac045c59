/**
 * @file transport.cpp
 * @brief Implementation of the Transport abstract class
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

#include <string>
#include <sstream>
#include <memory>
#include <ios>
#include <utility>

#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/copy.hpp>

#include "../errors.h"
#include "transport.h"

namespace meteoisd
{

namespace io = boost::iostreams;

std::unique_ptr<std::istream> Transport::open(const std::string& filename)
{
	std::string content = retrieve(filename);
	if (isCompressed(filename))
		content = decompress(filename, content);
	return std::make_unique<std::istringstream>(std::move(content));
}

bool Transport::isCompressed(const std::string& filename)
{
	auto endsWith = [&filename](const std::string& suffix) {
		return filename.length() >= suffix.length() &&
			filename.compare(filename.length() - suffix.length(), suffix.length(), suffix) == 0;
	};
	return endsWith(".gz") || endsWith(".z");
}

std::string Transport::decompress(const std::string& filename, const std::string& content)
{
	std::istringstream compressed{content};
	std::ostringstream decompressed;

	try {
		io::filtering_istream in;
		in.exceptions(std::ios_base::badbit);
		in.push(io::gzip_decompressor{});
		in.push(compressed);
		io::copy(in, decompressed);
	} catch (const io::gzip_error& e) {
		throw TransportError{filename, std::string{"corrupted gzip archive: "} + e.what()};
	} catch (const std::ios_base::failure& e) {
		throw TransportError{filename, std::string{"cannot decompress: "} + e.what()};
	}

	return decompressed.str();
}

}
