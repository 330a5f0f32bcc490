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

#include "File.h"

#include "utils/Filename.h"
#include "coverlibrary/filesystem/Errors.h"

#include <memory>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace coverlibrary
{

namespace errors = fs::errors;

namespace utils
{

namespace fs
{

void remove( const std::string& path )
{
    if ( unlink( path.c_str() ) != 0 )
        throw errors::System{ errno, "Failed to remove " + path };
}

uint64_t fileSize( const std::string& path )
{
    struct stat s;
    if ( stat( path.c_str(), &s ) != 0 )
        throw errors::System{ errno, "Failed to get " + path + " size" };
    return static_cast<uint64_t>( s.st_size );
}

void writeFile( const std::string& path, const std::vector<uint8_t>& content )
{
    // Hidden temporary file, so that folder listings skip it
    auto tmpPath = file::directory( path ) + '.' + file::fileName( path ) +
            ".XXXXXX";
    auto fd = mkstemp( &tmpPath[0] );
    if ( fd < 0 )
        throw errors::System{ errno, "Failed to create temporary file for " + path };
    try
    {
        {
            std::unique_ptr<FILE, decltype(&fclose)> f{ fdopen( fd, "wb" ), &fclose };
            if ( f == nullptr )
            {
                auto err = errno;
                close( fd );
                throw errors::System{ err, "Failed to open " + tmpPath };
            }
            if ( content.empty() == false &&
                 fwrite( content.data(), 1, content.size(), f.get() ) != content.size() )
                throw errors::System{ errno, "Failed to write " + tmpPath };
            if ( fflush( f.get() ) != 0 )
                throw errors::System{ errno, "Failed to flush " + tmpPath };
            if ( fsync( fileno( f.get() ) ) != 0 )
                throw errors::System{ errno, "Failed to sync " + tmpPath };
            if ( fclose( f.release() ) != 0 )
                throw errors::System{ errno, "Failed to close " + tmpPath };
        }
        // mkstemp creates the file with 0600
        if ( chmod( tmpPath.c_str(), 0644 ) != 0 )
            throw errors::System{ errno, "Failed to set " + tmpPath + " permissions" };
        if ( rename( tmpPath.c_str(), path.c_str() ) != 0 )
            throw errors::System{ errno, "Failed to move " + tmpPath + " to " + path };
    }
    catch ( const errors::System& )
    {
        unlink( tmpPath.c_str() );
        throw;
    }
}

}

}

}
