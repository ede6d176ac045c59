/**
 * @file curl_wrapper.cpp
 * @brief Implementation of a C++ wrapper class for CURL handles
 * @author Laurent Georget
 * @date 2020-09-28
 */
/*
 * Copyright (C) 2020  SAS Météo Concept <contact@meteo-concept.fr>
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

#include <chrono>
#include <string>
#include <functional>
#include <string_view>
#include <stdexcept>

#include <curl/curl.h>
#include <curl/easy.h>

#include "curl_wrapper.h"

namespace meteoisd {

CurlWrapper::CurlWrapper() :
	_handle(curl_easy_init(), &curl_easy_cleanup),
	_errorBuffer{}
{
	if (!_handle)
		throw std::runtime_error("Couldn't initialize a curl handle");

	curl_easy_setopt(_handle.get(), CURLOPT_ERRORBUFFER, _errorBuffer);
	curl_easy_setopt(_handle.get(), CURLOPT_WRITEFUNCTION, &CurlWrapper::receiveData);
	curl_easy_setopt(_handle.get(), CURLOPT_WRITEDATA, &_buffer);
	curl_easy_setopt(_handle.get(), CURLOPT_FAILONERROR, 1L);
	curl_easy_setopt(_handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
}

void CurlWrapper::setTimeout(std::chrono::seconds timeout)
{
	curl_easy_setopt(_handle.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
}

CURLcode CurlWrapper::download(const std::string& url, const std::function<void(const std::string&)>& parser)
{
	curl_easy_setopt(_handle.get(), CURLOPT_URL, url.data());

	_errorBuffer[0] = '\0';
	_buffer.clear();
	CURLcode res = curl_easy_perform(_handle.get());
	if (res == CURLE_OK)
		parser(_buffer);
	_buffer.clear();
	return res;
}

std::string_view CurlWrapper::getLastError() const
{
	return std::string_view(_errorBuffer);
}

long CurlWrapper::getLastRequestCode() const
{
	long code = 0;
	curl_easy_getinfo(_handle.get(), CURLINFO_RESPONSE_CODE, &code);
	return code;
}

std::size_t CurlWrapper::receiveData(void* buffer, std::size_t size, std::size_t nbemb, void* userp)
{
	std::string* destination = reinterpret_cast<std::string*>(userp);
	std::size_t realsize = size * nbemb;
	destination->append(reinterpret_cast<char*>(buffer), realsize);
	return realsize;
}

}
