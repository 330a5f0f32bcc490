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

#include "OrphanSweeper.h"

#include "Album.h"
#include "Track.h"
#include "covers/CoverStorage.h"
#include "coverlibrary/filesystem/Errors.h"
#include "database/SqliteTools.h"
#include "logging/Logger.h"
#include "utils/Directory.h"
#include "utils/Filename.h"

#include <initializer_list>
#include <unordered_set>

namespace coverlibrary
{

OrphanSweeper::OrphanSweeper( sqlite::Connection* dbConn, ICoverStorage* storage )
    : m_dbConn( dbConn )
    , m_storage( storage )
{
}

uint64_t OrphanSweeper::run( const std::string& coversRoot )
{
    std::vector<std::string> paths;
    {
        auto ctx = m_dbConn->acquireReadContext();
        paths = Track::referencedPaths( m_dbConn );
        auto albumPaths = Album::referencedPaths( m_dbConn );
        paths.insert( end( paths ), begin( albumPaths ), end( albumPaths ) );
    }

    // Rows may spell the covers root differently than we do (relative path,
    // symbolic link, "./" component...), so compare resolved paths
    std::unordered_set<std::string> referenced;
    for ( auto& p : paths )
    {
        try
        {
            referenced.insert( utils::fs::canonicalPath( p ) );
        }
        catch ( const fs::errors::System& ex )
        {
            if ( ex.isNotFound() == false )
                LOG_WARN( "Failed to resolve referenced cover ", p, ": ", ex.what() );
        }
        referenced.insert( std::move( p ) );
    }

    auto root = utils::file::toFolderPath( coversRoot );
    uint64_t nbRemoved = 0;
    for ( const auto folder : { CoverStorage::TracksFolder, CoverStorage::AlbumsFolder } )
    {
        std::vector<std::string> files;
        try
        {
            files = utils::fs::listFiles( root + folder );
        }
        catch ( const fs::errors::System& ex )
        {
            LOG_WARN( "Skipping ", root + folder, ": ", ex.what() );
            continue;
        }
        for ( const auto& f : files )
        {
            if ( referenced.find( f ) != end( referenced ) )
                continue;
            try
            {
                if ( referenced.find( utils::fs::canonicalPath( f ) ) != end( referenced ) )
                    continue;
            }
            catch ( const fs::errors::System& ex )
            {
                LOG_WARN( "Keeping ", f, ", its path can't be resolved: ", ex.what() );
                continue;
            }
            try
            {
                m_storage->deleteFile( f );
                ++nbRemoved;
                LOG_DEBUG( "Removed orphaned cover ", f );
            }
            catch ( const fs::errors::Exception& ex )
            {
                LOG_WARN( "Failed to remove orphaned cover ", f, ": ", ex.what() );
            }
        }
    }
    LOG_INFO( "Removed ", nbRemoved, " orphaned cover(s) out of ",
              paths.size(), " referenced" );
    return nbRemoved;
}

}
