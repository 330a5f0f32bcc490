/*****************************************************************************
 * Cover Library
 *****************************************************************************
 * Copyright (C) 2015-2019 Hugo Beauzée-Luyssen, Videolabs, VideoLAN
 *
 * Authors: Hugo Beauzée-Luyssen <hugo@beauzee.fr>
 *
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation; either version 2.1 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program; if not, write to the Free Software Foundation,
 * Inc., 51 Franklin Street, Fifth Floor, Boston MA 02110-1301, USA.
 *****************************************************************************/

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace coverlibrary
{

namespace utils
{

namespace fs
{

/**
 * @brief remove Removes a file
 * @throw fs::errors::System in case of failure, including when the file is
 *        already gone.
 */
void remove( const std::string& path );

/**
 * @brief fileSize Returns a file size in bytes
 * @throw fs::errors::System if the file can't be stat'ed
 */
uint64_t fileSize( const std::string& path );

/**
 * @brief writeFile Atomically replaces the content of a file
 *
 * The content is written to a temporary file in the same folder, which is
 * then renamed over the destination. Readers either see the previous content
 * or the complete new one.
 * @throw fs::errors::System in case of failure. The temporary file is removed.
 */
void writeFile( const std::string& path, const std::vector<uint8_t>& content );

}

}

}
