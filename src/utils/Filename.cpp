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

#include "utils/Filename.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

#define DIR_SEPARATOR '/'

namespace coverlibrary
{

namespace utils
{

namespace file
{

std::string extension( const std::string& fileName )
{
    auto pos = fileName.find_last_of( '.' );
    if ( pos == std::string::npos )
        return {};
    // A dot in a parent folder is not an extension
    auto sep = fileName.find_last_of( DIR_SEPARATOR );
    if ( sep != std::string::npos && sep > pos )
        return {};
    return fileName.substr( pos + 1 );
}

std::string stripExtension( const std::string& fileName )
{
    auto pos = fileName.find_last_of( '.' );
    if ( pos == std::string::npos )
        return fileName;
    auto sep = fileName.find_last_of( DIR_SEPARATOR );
    if ( sep != std::string::npos && sep > pos )
        return fileName;
    return fileName.substr( 0, pos );
}

std::string directory( const std::string& filePath )
{
    auto pos = filePath.find_last_of( DIR_SEPARATOR );
    if ( pos == std::string::npos )
        return {};
    return filePath.substr( 0, pos + 1 );
}

std::string fileName( const std::string& filePath )
{
    auto pos = filePath.find_last_of( DIR_SEPARATOR );
    if ( pos == std::string::npos )
        return filePath;
    return filePath.substr( pos + 1 );
}

std::string toFolderPath( std::string path )
{
    if ( path.empty() == true || *path.crbegin() != DIR_SEPARATOR )
        path += DIR_SEPARATOR;
    return path;
}

std::stack<std::string> splitPath( const std::string& path, bool isDirectory )
{
    std::stack<std::string> res;
    std::string currPath = isDirectory ? toFolderPath( path )
                                       : directory( path );
    if ( isDirectory == false )
        res.push( fileName( path ) );
    // Drop the trailing separator, then peel one folder at a time
    currPath.pop_back();
    while ( currPath.empty() == false )
    {
        auto pos = currPath.find_last_of( DIR_SEPARATOR );
        if ( pos == std::string::npos )
        {
            res.push( currPath );
            break;
        }
        auto folder = currPath.substr( pos + 1 );
        if ( folder.empty() == false )
            res.push( std::move( folder ) );
        currPath.erase( pos );
    }
    return res;
}

}

namespace str
{

std::string toLower( std::string value )
{
    std::transform( begin( value ), end( value ), begin( value ),
                    []( unsigned char c ) {
        return static_cast<char>( tolower( c ) );
    });
    return value;
}

bool toInt64( const std::string& value, int64_t& res )
{
    if ( value.empty() == true ||
         isspace( static_cast<unsigned char>( value[0] ) ) )
        return false;
    char* end;
    errno = 0;
    auto v = strtoll( value.c_str(), &end, 10 );
    if ( errno != 0 || *end != 0 )
        return false;
    res = static_cast<int64_t>( v );
    return true;
}

}

}

}
