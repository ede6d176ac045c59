/**
 * @file local_mirror_transport.h
 * @brief Definition of the LocalMirrorTransport class
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

#ifndef LOCAL_MIRROR_TRANSPORT_H
#define LOCAL_MIRROR_TRANSPORT_H

#include <string>

#include "transport.h"

namespace meteoisd
{

/**
 * @brief Read files from a local copy of the NOAA archive
 *
 * The copy must keep the layout of the archive, the file
 * "/pub/data/noaa/2018/720534-00161-2018.gz" is looked for at
 * "<root>/pub/data/noaa/2018/720534-00161-2018.gz".
 */
class LocalMirrorTransport : public Transport
{
public:
	explicit LocalMirrorTransport(std::string rootDirectory);

protected:
	std::string retrieve(const std::string& filename) override;

private:
	std::string _rootDirectory;
};

}

#endif /* LOCAL_MIRROR_TRANSPORT_H */
