/**
 * @file curl_transport.cpp
 * @brief Implementation of the CurlTransport class
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

#include <iostream>
#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include <systemd/sd-daemon.h>
#include <curl/curl.h>

#include "../errors.h"
#include "curl_transport.h"

namespace meteoisd
{

CurlTransport::CurlTransport(std::string baseUrl, std::chrono::seconds timeout) :
	_baseUrl{std::move(baseUrl)}
{
	while (!_baseUrl.empty() && _baseUrl.back() == '/')
		_baseUrl.pop_back();
	_client.setTimeout(timeout);
}

std::string CurlTransport::retrieve(const std::string& filename)
{
	std::string url = _baseUrl + (filename.empty() || filename.front() != '/' ? "/" : "") + filename;
	std::cerr << SD_DEBUG << "[ISD] protocol: " << "Downloading " << url << std::endl;

	std::string content;
	CURLcode ret = _client.download(url, [&content](const std::string& body) {
		content = body;
	});

	if (ret != CURLE_OK) {
		std::string_view error = _client.getLastError();
		std::string reason = error.empty() ? curl_easy_strerror(ret) : std::string{error};
		long code = _client.getLastRequestCode();
		if (code != 0)
			reason += " (code " + std::to_string(code) + ")";
		std::cerr << SD_ERR << "[ISD] protocol: " << "Download of " << url << " failed: " << reason << std::endl;
		throw TransportError{filename, reason};
	}

	std::cerr << SD_DEBUG << "[ISD] protocol: " << "Downloaded " << content.size() << " bytes" << std::endl;
	return content;
}

}
