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

#include "MigrationEngine.h"

#include "Album.h"
#include "Track.h"
#include "coverlibrary/ICoverStorage.h"
#include "coverlibrary/filesystem/Errors.h"
#include "database/SqliteTools.h"
#include "logging/Logger.h"

namespace coverlibrary
{

MigrationEngine::MigrationEngine( sqlite::Connection* dbConn,
                                  ICoverStorage* storage )
    : m_dbConn( dbConn )
    , m_storage( storage )
{
}

MigrationProgress MigrationEngine::run()
{
    MigrationProgress progress;
    auto chrono = std::chrono::steady_clock::now();

    std::vector<Track> tracks;
    std::vector<Album> albums;
    {
        auto ctx = m_dbConn->acquireReadContext();
        tracks = Track::fetchMigrationCandidates( m_dbConn );
        albums = Album::fetchMigrationCandidates( m_dbConn );
    }
    progress.total = tracks.size() + albums.size();
    LOG_INFO( "Migrating ", tracks.size(), " track covers and ", albums.size(),
              " album arts" );

    for ( const auto& t : tracks )
    {
        LOG_DEBUG( "Migrating track #", t.id(), " (", toString( t.coverState() ), ')' );
        try
        {
            auto path = m_storage->writeTrackCover( t.id(), t.inlineCover() );
            try
            {
                Track::setCoverPath( m_dbConn, t.id(), path );
                ++progress.tracksMigrated;
            }
            catch ( const sqlite::errors::Exception& ex )
            {
                progress.errors.push_back( "Failed to update track " +
                        std::to_string( t.id() ) + " path: " + ex.what() );
                LOG_ERROR( progress.errors.back() );
            }
        }
        catch ( const fs::errors::Exception& ex )
        {
            progress.errors.push_back( "Failed to save track " +
                    std::to_string( t.id() ) + " cover: " + ex.what() );
            LOG_ERROR( progress.errors.back() );
        }
        ++progress.processed;
    }

    for ( const auto& a : albums )
    {
        LOG_DEBUG( "Migrating album #", a.id(), " (", toString( a.coverState() ), ')' );
        try
        {
            auto path = m_storage->writeAlbumArt( a.id(), a.inlineArt() );
            try
            {
                Album::setArtPath( m_dbConn, a.id(), path );
                ++progress.albumsMigrated;
            }
            catch ( const sqlite::errors::Exception& ex )
            {
                progress.errors.push_back( "Failed to update album " +
                        std::to_string( a.id() ) + " path: " + ex.what() );
                LOG_ERROR( progress.errors.back() );
            }
        }
        catch ( const fs::errors::Exception& ex )
        {
            progress.errors.push_back( "Failed to save album " +
                    std::to_string( a.id() ) + " art: " + ex.what() );
            LOG_ERROR( progress.errors.back() );
        }
        ++progress.processed;
    }

    auto duration = std::chrono::steady_clock::now() - chrono;
    LOG_INFO( "Migrated ", progress.tracksMigrated, " track covers and ",
              progress.albumsMigrated, " album arts in ",
              std::chrono::duration_cast<std::chrono::milliseconds>( duration ).count(),
              "ms. ", progress.errors.size(), " error(s)" );
    return progress;
}

}
