/**
 * @file local_mirror_transport.cpp
 * @brief Implementation of the LocalMirrorTransport class
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
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <systemd/sd-daemon.h>

#include "../errors.h"
#include "local_mirror_transport.h"

namespace meteoisd
{

LocalMirrorTransport::LocalMirrorTransport(std::string rootDirectory) :
	_rootDirectory{std::move(rootDirectory)}
{
	while (!_rootDirectory.empty() && _rootDirectory.back() == '/')
		_rootDirectory.pop_back();
}

std::string LocalMirrorTransport::retrieve(const std::string& filename)
{
	std::string path = _rootDirectory + (filename.empty() || filename.front() != '/' ? "/" : "") + filename;
	std::cerr << SD_DEBUG << "[ISD] protocol: " << "Reading " << path << std::endl;

	std::ifstream file{path, std::ios::in | std::ios::binary};
	if (!file)
		throw TransportError{filename, "cannot open " + path};

	std::ostringstream content;
	content << file.rdbuf();
	if (file.bad())
		throw TransportError{filename, "error while reading " + path};
	return content.str();
}

}
