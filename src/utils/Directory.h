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

#include <string>
#include <vector>

namespace coverlibrary
{

namespace utils
{

namespace fs
{

/**
 * @brief isDirectory Returns true if the provided path is a directory
 * @throw fs::errors::System if the path can't be accessed
 */
bool isDirectory( const std::string& path );

/**
 * @brief canonicalPath Returns the absolute path to an existing file or
 *        folder, with symbolic links, "." & ".." resolved
 * @throw fs::errors::System if the path doesn't exist or can't be resolved
 */
std::string canonicalPath( const std::string& path );

/**
 * @brief mkdir Creates a directory and all its missing parents
 * @return false if one of the folders couldn't be created
 */
bool mkdir( const std::string& path );

/**
 * @brief rmdir Recursively removes a directory and its content
 */
bool rmdir( std::string path );

/**
 * @brief listFiles Lists the regular files contained in a directory
 * @param path The directory to list. Subdirectories are not traversed
 * @return The full path of each file, sorted
 * @throw fs::errors::System if the directory can't be opened or read
 */
std::vector<std::string> listFiles( const std::string& path );

}

}

}
