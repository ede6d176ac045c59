/**
 * @file curl_transport.h
 * @brief Definition of the CurlTransport class
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

#ifndef CURL_TRANSPORT_H
#define CURL_TRANSPORT_H

#include <chrono>
#include <string>

#include "../curl_wrapper.h"
#include "transport.h"

namespace meteoisd
{

/**
 * @brief Download files from the NOAA servers
 */
class CurlTransport : public Transport
{
public:
	static constexpr char FTP_BASE_URL[] = "ftp://ftp.ncei.noaa.gov";
	static constexpr char HTTP_BASE_URL[] = "https://www.ncei.noaa.gov";

	/**
	 * @param baseUrl The URL of the root of the archive, filenames are
	 * appended to it
	 * @param timeout The maximum duration of each download, zero for no
	 * limit
	 */
	explicit CurlTransport(std::string baseUrl = FTP_BASE_URL, std::chrono::seconds timeout = std::chrono::seconds{30});

protected:
	std::string retrieve(const std::string& filename) override;

private:
	std::string _baseUrl;
	CurlWrapper _client;
};

}

#endif /* CURL_TRANSPORT_H */
