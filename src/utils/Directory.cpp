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

#include "Directory.h"

#include "utils/Filename.h"
#include "logging/Logger.h"
#include "coverlibrary/filesystem/Errors.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace coverlibrary
{

namespace errors = fs::errors;

namespace utils
{

namespace fs
{

namespace
{
    const auto ERR_FS_OBJECT_ACCESS = "Error accessing file-system object at ";
}

bool isDirectory( const std::string& path )
{
    struct stat s;
    if ( lstat( path.c_str(), &s ) != 0 )
        throw errors::System{ errno, ERR_FS_OBJECT_ACCESS + path };
    return S_ISDIR( s.st_mode );
}

std::string canonicalPath( const std::string& path )
{
    char abs[PATH_MAX];
    if ( realpath( path.c_str(), abs ) == nullptr )
        throw errors::System{ errno, "Failed to resolve " + path };
    return abs;
}

bool mkdir( const std::string& path )
{
    auto paths = utils::file::splitPath( path, true );
    std::string fullPath;
    if ( path.empty() == false && path[0] == '/' )
        fullPath = "/";
    while ( paths.empty() == false )
    {
        fullPath += paths.top();
        if ( ::mkdir( fullPath.c_str(), S_IRWXU ) != 0 )
        {
            if ( errno != EEXIST )
                return false;
        }
        paths.pop();
        fullPath += "/";
    }
    return true;
}

bool rmdir( std::string path )
{
    path = utils::file::toFolderPath( path );

    std::unique_ptr<DIR, int(*)(DIR*)> dir{
        opendir( path.c_str() ), &closedir
    };
    if ( dir == nullptr )
        return false;

    for ( auto d = readdir( dir.get() );
          d != nullptr; d = readdir( dir.get() ) )
    {
        if ( !strcmp( d->d_name, "." ) ||
             !strcmp( d->d_name, ".." ) )
            continue;

        auto p = path + d->d_name;
        struct stat s;
        if ( lstat( p.c_str(), &s ) < 0 )
            return false;
        switch ( s.st_mode & S_IFMT )
        {
            case S_IFDIR:
                if ( rmdir( p ) == false )
                    return false;
                break;
            case S_IFLNK:
            case S_IFREG:
                unlink( p.c_str() );
                break;
            default:
                LOG_WARN( "Unhandled file type during folder removal: ", p );
                break;
        }
    }
    ::rmdir( path.c_str() );
    return true;
}

std::vector<std::string> listFiles( const std::string& path )
{
    auto folder = utils::file::toFolderPath( path );
    std::unique_ptr<DIR, int(*)(DIR*)> dir{
        opendir( folder.c_str() ), &closedir
    };
    if ( dir == nullptr )
        throw errors::System{ errno, "Failed to open directory " + path };

    std::vector<std::string> files;
    errno = 0;
    dirent* d;
    while ( ( d = readdir( dir.get() ) ) != nullptr )
    {
        if ( d->d_name[0] == '.' )
        {
            // Skip . & .. but also hidden files, such as pending temporary
            // files
            errno = 0;
            continue;
        }
        auto p = folder + d->d_name;
        struct stat s;
        if ( stat( p.c_str(), &s ) != 0 )
        {
            LOG_WARN( "Failed to stat ", p, ": ", strerror( errno ) );
            errno = 0;
            continue;
        }
        if ( S_ISREG( s.st_mode ) )
            files.push_back( std::move( p ) );
        errno = 0;
    }
    if ( errno != 0 )
        throw errors::System{ errno, "Failed to read directory " + path };
    std::sort( begin( files ), end( files ) );
    return files;
}

}

}

}
