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

#include "PathSynchronizer.h"

#include "Album.h"
#include "Track.h"
#include "covers/CoverStorage.h"
#include "coverlibrary/filesystem/Errors.h"
#include "database/SqliteTools.h"
#include "database/SqliteTransaction.h"
#include "logging/Logger.h"
#include "utils/Directory.h"
#include "utils/Filename.h"

namespace coverlibrary
{

namespace
{

bool isCoverExtension( const std::string& ext )
{
    auto e = utils::str::toLower( ext );
    return e == "jpg" || e == "jpeg" || e == "png" || e == "webp";
}

}

PathSynchronizer::PathSynchronizer( sqlite::Connection* dbConn )
    : m_dbConn( dbConn )
{
}

MigrationProgress PathSynchronizer::run( const std::string& coversRoot )
{
    MigrationProgress progress;
    auto root = utils::file::toFolderPath( coversRoot );

    auto trackFiles = listCandidates( root + CoverStorage::TracksFolder,
                                      progress.errors );
    auto albumFiles = listCandidates( root + CoverStorage::AlbumsFolder,
                                      progress.errors );
    LOG_INFO( "Found ", trackFiles.size(), " track covers and ",
              albumFiles.size(), " album arts in ", root );

    if ( trackFiles.empty() == false )
        progress.tracksMigrated = applyTrackPaths( trackFiles, progress.errors );
    if ( albumFiles.empty() == false )
        progress.albumsMigrated = applyAlbumPaths( albumFiles, progress.errors );

    progress.total = progress.tracksMigrated + progress.albumsMigrated;
    progress.processed = progress.total;
    LOG_INFO( "Synced ", progress.tracksMigrated, " track covers and ",
              progress.albumsMigrated, " album arts. ",
              progress.errors.size(), " error(s)" );
    return progress;
}

std::vector<PathSynchronizer::Candidate>
PathSynchronizer::listCandidates( const std::string& folder,
                                  std::vector<std::string>& errors )
{
    std::vector<Candidate> candidates;
    std::vector<std::string> files;
    try
    {
        files = utils::fs::listFiles( folder );
    }
    catch ( const fs::errors::System& ex )
    {
        if ( ex.isNotFound() == true )
        {
            LOG_INFO( "No covers folder at ", folder );
            return candidates;
        }
        errors.push_back( "Failed to read " + folder + ": " + ex.what() );
        LOG_ERROR( errors.back() );
        return candidates;
    }
    for ( auto& f : files )
    {
        auto name = utils::file::fileName( f );
        if ( isCoverExtension( utils::file::extension( name ) ) == false )
            continue;
        int64_t id;
        if ( utils::str::toInt64( utils::file::stripExtension( name ), id ) == false )
        {
            LOG_DEBUG( "Ignoring ", f, ": not named after an id" );
            continue;
        }
        candidates.emplace_back( id, std::move( f ) );
    }
    return candidates;
}

size_t PathSynchronizer::applyTrackPaths( const std::vector<Candidate>& candidates,
                                          std::vector<std::string>& errors )
{
    size_t synced = 0;
    auto t = m_dbConn->newTransaction();
    for ( const auto& c : candidates )
    {
        try
        {
            if ( Track::setCoverPath( m_dbConn, c.first, c.second ) == 0 )
            {
                LOG_DEBUG( "Track #", c.first, " not found, ignoring ", c.second );
                continue;
            }
            ++synced;
        }
        catch ( const sqlite::errors::Exception& ex )
        {
            errors.push_back( "Failed to update track " +
                              std::to_string( c.first ) + ": " + ex.what() );
            LOG_ERROR( errors.back() );
        }
    }
    try
    {
        t->commit();
    }
    catch ( const sqlite::errors::Exception& ex )
    {
        errors.push_back( std::string{ "Failed to commit track paths: " } + ex.what() );
        LOG_ERROR( errors.back() );
        // Nothing was persisted
        synced = 0;
    }
    return synced;
}

size_t PathSynchronizer::applyAlbumPaths( const std::vector<Candidate>& candidates,
                                          std::vector<std::string>& errors )
{
    size_t synced = 0;
    auto t = m_dbConn->newTransaction();
    for ( const auto& c : candidates )
    {
        try
        {
            if ( Album::setArtPath( m_dbConn, c.first, c.second ) == 0 )
            {
                LOG_DEBUG( "Album #", c.first, " not found, ignoring ", c.second );
                continue;
            }
            ++synced;
        }
        catch ( const sqlite::errors::Exception& ex )
        {
            errors.push_back( "Failed to update album " +
                              std::to_string( c.first ) + ": " + ex.what() );
            LOG_ERROR( errors.back() );
        }
    }
    try
    {
        t->commit();
    }
    catch ( const sqlite::errors::Exception& ex )
    {
        errors.push_back( std::string{ "Failed to commit album paths: " } + ex.what() );
        LOG_ERROR( errors.back() );
        synced = 0;
    }
    return synced;
}

}
