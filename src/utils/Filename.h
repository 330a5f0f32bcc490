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
#include <stack>
#include <string>

namespace coverlibrary
{

namespace utils
{

namespace file
{
    /**
     * @brief extension Returns the extension of a file, without the leading '.'
     *
     * An empty string is returned when the file has no extension.
     */
    std::string extension( const std::string& fileName );
    std::string stripExtension( const std::string& fileName );
    /**
     * @brief directory Returns the directory part of a path, including the
     *                  trailing '/'
     */
    std::string directory( const std::string& filePath );
    std::string fileName( const std::string& filePath );
    /**
     * @brief toFolderPath Ensures a path ends with a '/'
     */
    std::string toFolderPath( std::string path );
    /**
     * @brief splitPath Splits a path into its components, the top of the stack
     *                  being the first one
     */
    std::stack<std::string> splitPath( const std::string& path, bool isDirectory );
}

namespace str
{
    std::string toLower( std::string value );
    /**
     * @brief toInt64 Parses a string which must entirely be a base 10 integer
     * @param value The string to parse
     * @param res The parsed value, only written in case of success
     * @return true if the whole string was consumed
     */
    bool toInt64( const std::string& value, int64_t& res );
}

}

}
