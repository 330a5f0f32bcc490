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

#include "CoverLibrary.h"

#include "Album.h"
#include "Settings.h"
#include "Track.h"
#include "covers/CoverStorage.h"
#include "covers/DuplicateMerger.h"
#include "covers/MigrationEngine.h"
#include "covers/OrphanSweeper.h"
#include "covers/PathSynchronizer.h"
#include "database/SqliteConnection.h"
#include "database/SqliteTools.h"
#include "database/SqliteTransaction.h"
#include "logging/Logger.h"
#include "utils/Directory.h"
#include "utils/Filename.h"

#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <stdexcept>

namespace coverlibrary
{

CoverLibrary::CoverLibrary( const std::string& dbPath,
                            const std::string& coversRoot,
                            const SetupConfig* cfg )
    : m_initialized( false )
    , m_dbPath( dbPath )
    , m_coversRoot( utils::file::toFolderPath( coversRoot ) )
{
    if ( cfg != nullptr )
    {
        Log::setLogLevel( cfg->logLevel );
        if ( cfg->logger != nullptr )
            Log::SetLogger( cfg->logger );
        m_storage = cfg->storage;
    }
    if ( m_storage == nullptr )
        m_storage = std::make_shared<CoverStorage>( m_coversRoot );
}

CoverLibrary::~CoverLibrary()
{
    // Flush the statements before the connection gets closed
    m_dbConnection.reset();
}

InitializeResult CoverLibrary::initialize()
{
    std::lock_guard<std::mutex> lock( m_mutex );
    if ( m_initialized == true )
        return InitializeResult::AlreadyInitialized;

    LOG_INFO( "Initializing cover library. Database model is ",
              Settings::DbModelVersion );

    for ( const auto folder : { CoverStorage::TracksFolder, CoverStorage::AlbumsFolder } )
    {
        auto path = m_coversRoot + folder;
        if ( utils::fs::mkdir( path ) == false )
        {
            LOG_ERROR( "Failed to create covers directory (", path, "): ",
                       strerror( errno ) );
            return InitializeResult::Failed;
        }
    }

    try
    {
        m_dbConnection = sqlite::Connection::connect( m_dbPath );
        onDbConnectionReady( m_dbConnection.get() );

        auto t = m_dbConnection->newTransaction();
        Settings::createTable( m_dbConnection.get() );
        Settings settings( m_dbConnection.get() );
        settings.load();
        if ( settings.dbModelVersion() != Settings::DbModelVersion )
        {
            LOG_ERROR( "Unsupported database model version ",
                       settings.dbModelVersion(), ". Expected ",
                       Settings::DbModelVersion );
            return InitializeResult::Failed;
        }
        createAllTables();
        t->commit();
    }
    catch ( const sqlite::errors::Exception& ex )
    {
        LOG_ERROR( "Can't initialize cover library: ", ex.what() );
        return InitializeResult::Failed;
    }

    if ( m_dbConnection->checkSchemaIntegrity() == false )
        LOG_WARN( "Database integrity check failed" );

    LOG_INFO( "Successfully initialized" );
    m_initialized = true;
    return InitializeResult::Success;
}

bool CoverLibrary::isInitialized() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    return m_initialized;
}

void CoverLibrary::setVerbosity( LogLevel v )
{
    Log::setLogLevel( v );
}

MigrationProgress CoverLibrary::migrateInlineToFiles()
{
    checkInitialized();
    MigrationEngine engine( m_dbConnection.get(), m_storage.get() );
    return engine.run();
}

MigrationProgress CoverLibrary::syncPathsFromFiles( const std::string& coversRoot )
{
    checkInitialized();
    PathSynchronizer synchronizer( m_dbConnection.get() );
    return synchronizer.run( coversRoot );
}

MergeResult CoverLibrary::mergeDuplicateCovers()
{
    checkInitialized();
    DuplicateMerger merger( m_dbConnection.get(), m_storage.get() );
    return merger.run();
}

uint64_t CoverLibrary::clearInlineAfterMigration()
{
    checkInitialized();
    auto dbConn = m_dbConnection.get();
    auto t = dbConn->newTransaction();
    auto nbTracks = Track::clearInlineCovers( dbConn );
    auto nbAlbums = Album::clearInlineArt( dbConn );
    t->commit();
    LOG_INFO( "Cleared inline covers of ", nbTracks, " tracks and ",
              nbAlbums, " albums" );
    return static_cast<uint64_t>( nbTracks + nbAlbums );
}

uint64_t CoverLibrary::cleanupOrphanedCovers()
{
    checkInitialized();
    OrphanSweeper sweeper( m_dbConnection.get(), m_storage.get() );
    return sweeper.run( m_coversRoot );
}

std::string CoverLibrary::trackCoverPath( int64_t trackId ) const
{
    checkInitialized();
    return Track::coverPath( m_dbConnection.get(), trackId );
}

std::unordered_map<int64_t, std::string>
CoverLibrary::batchCoverPaths( const std::vector<int64_t>& trackIds ) const
{
    checkInitialized();
    return Track::coverPaths( m_dbConnection.get(), trackIds );
}

std::string CoverLibrary::albumArtPath( int64_t albumId ) const
{
    checkInitialized();
    return Album::artPath( m_dbConnection.get(), albumId );
}

sqlite::Connection* CoverLibrary::getConn() const
{
    return m_dbConnection.get();
}

const std::string& CoverLibrary::coversRoot() const
{
    return m_coversRoot;
}

void CoverLibrary::onDbConnectionReady( sqlite::Connection* )
{
}

void CoverLibrary::createAllTables()
{
    auto dbConn = m_dbConnection.get();
    Track::createTable( dbConn );
    Album::createTable( dbConn );
}

void CoverLibrary::checkInitialized() const
{
    if ( isInitialized() == false )
        throw std::logic_error{ "The cover library must be initialized first" };
}

}

extern "C" coverlibrary::ICoverLibrary* NewCoverLibrary( const char* dbPath,
                                                        const char* coversRoot,
                                                        const coverlibrary::SetupConfig* cfg )
{
    if ( dbPath == nullptr || coversRoot == nullptr )
        return nullptr;
    return new coverlibrary::CoverLibrary( dbPath, coversRoot, cfg );
}
