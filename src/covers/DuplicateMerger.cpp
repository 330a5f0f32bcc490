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

#include "DuplicateMerger.h"

#include "Track.h"
#include "coverlibrary/ICoverStorage.h"
#include "coverlibrary/filesystem/Errors.h"
#include "database/SqliteTools.h"
#include "database/SqliteTransaction.h"
#include "logging/Logger.h"
#include "utils/File.h"
#include "utils/Sha256Hasher.h"

#include <algorithm>
#include <map>

namespace coverlibrary
{

DuplicateMerger::DuplicateMerger( sqlite::Connection* dbConn,
                                  ICoverStorage* storage )
    : m_dbConn( dbConn )
    , m_storage( storage )
{
}

MergeResult DuplicateMerger::run()
{
    MergeResult result;
    auto chrono = std::chrono::steady_clock::now();

    auto albums = Track::listAlbumNames( m_dbConn );
    LOG_INFO( "Looking for duplicated covers in ", albums.size(), " albums" );
    for ( const auto& album : albums )
    {
        ++result.albumsProcessed;
        mergeAlbum( album, result );
    }

    auto duration = std::chrono::steady_clock::now() - chrono;
    LOG_INFO( "Merged ", result.coversMerged, " covers, saving ",
              result.spaceSavedBytes, " bytes in ",
              std::chrono::duration_cast<std::chrono::milliseconds>( duration ).count(),
              "ms. ", result.errors.size(), " error(s)" );
    return result;
}

std::vector<std::vector<CoverFile>>
DuplicateMerger::findDuplicates( const std::vector<CoverFile>& files,
                                 std::vector<std::string>& errors )
{
    SizeBuckets buckets;
    for ( const auto& f : files )
        buckets.add( f.path, f.size );

    std::map<std::string, std::vector<CoverFile>> byHash;
    for ( const auto& bucket : buckets.hashCandidates() )
    {
        for ( const auto& f : bucket )
        {
            try
            {
                byHash[utils::hash::Sha256Hasher::fromFile( f.path )].push_back( f );
            }
            catch ( const fs::errors::Exception& ex )
            {
                errors.push_back( "Failed to hash " + f.path + ": " + ex.what() );
                LOG_ERROR( errors.back() );
            }
        }
    }

    std::vector<std::vector<CoverFile>> groups;
    for ( auto& p : byHash )
    {
        if ( p.second.size() < 2 )
            continue;
        std::sort( begin( p.second ), end( p.second ),
                   []( const CoverFile& lhs, const CoverFile& rhs ) {
            return lhs.path < rhs.path;
        });
        groups.push_back( std::move( p.second ) );
    }
    return groups;
}

void DuplicateMerger::mergeAlbum( const std::string& album, MergeResult& result )
{
    auto tracks = Track::fetchCoverPathsByAlbum( m_dbConn, album );
    if ( tracks.size() < 2 )
        return;

    std::map<std::string, std::vector<int64_t>> pathToTrackIds;
    for ( const auto& t : tracks )
        pathToTrackIds[t.second].push_back( t.first );
    if ( pathToTrackIds.size() < 2 )
        return;

    std::vector<CoverFile> files;
    files.reserve( pathToTrackIds.size() );
    for ( const auto& p : pathToTrackIds )
    {
        try
        {
            files.push_back( CoverFile{ p.first, utils::fs::fileSize( p.first ) } );
        }
        catch ( const fs::errors::Exception& ex )
        {
            result.errors.push_back( "Failed to stat " + p.first + ": " + ex.what() );
            LOG_ERROR( result.errors.back() );
        }
    }

    auto groups = findDuplicates( files, result.errors );
    LOG_DEBUG( "Album ", album, ": ", files.size(), " cover files, ",
               groups.size(), " duplicate group(s)" );

    for ( const auto& group : groups )
    {
        const auto& canonical = group.front().path;
        std::vector<const CoverFile*> toDelete;
        auto t = m_dbConn->newTransaction();
        for ( auto it = begin( group ) + 1; it != end( group ); ++it )
        {
            auto stillReferenced = false;
            for ( auto trackId : pathToTrackIds[it->path] )
            {
                try
                {
                    Track::setCoverPath( m_dbConn, trackId, canonical );
                }
                catch ( const sqlite::errors::Exception& ex )
                {
                    result.errors.push_back( "Failed to update track " +
                            std::to_string( trackId ) + ": " + ex.what() );
                    LOG_ERROR( result.errors.back() );
                    stillReferenced = true;
                }
            }
            if ( stillReferenced == false )
                toDelete.push_back( &*it );
        }
        try
        {
            t->commit();
        }
        catch ( const sqlite::errors::Exception& ex )
        {
            result.errors.push_back( "Failed to commit merge of " + canonical +
                                     ": " + ex.what() );
            LOG_ERROR( result.errors.back() );
            // The files are still referenced
            continue;
        }
        // Release the database before touching the files
        t.reset();

        for ( const auto f : toDelete )
        {
            try
            {
                m_storage->deleteFile( f->path );
            }
            catch ( const fs::errors::System& ex )
            {
                if ( ex.isNotFound() == true )
                {
                    LOG_DEBUG( f->path, " was already removed" );
                    continue;
                }
                result.errors.push_back( "Failed to delete " + f->path + ": " + ex.what() );
                LOG_ERROR( result.errors.back() );
                continue;
            }
            catch ( const fs::errors::Exception& ex )
            {
                result.errors.push_back( "Failed to delete " + f->path + ": " + ex.what() );
                LOG_ERROR( result.errors.back() );
                continue;
            }
            result.spaceSavedBytes += f->size;
            ++result.coversMerged;
            LOG_DEBUG( "Merged ", f->path, " into ", canonical );
        }
    }
}

}
