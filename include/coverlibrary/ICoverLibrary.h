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
#include <unordered_map>
#include <vector>

#include "coverlibrary/ILogger.h"
#include "coverlibrary/Types.h"

namespace coverlibrary
{

struct SetupConfig
{
    /**
     * @brief logLevel The default log level to initialize the cover library with.
     * This can be overwriten at a later point using ICoverLibrary::setVerbosity
     */
    LogLevel logLevel = LogLevel::Error;

    /**
     * @brief logger An ILogger instance if the application wishes to use a
     * custom one.
     * If nullptr is provided, the default IOstream logger will be used.
     */
    std::shared_ptr<ILogger> logger;

    /**
     * @brief storage The component used to write & delete cover files.
     * If nullptr is provided, covers are written under the covers root folder
     * provided to NewCoverLibrary, in its tracks/ & albums/ subfolders.
     */
    CoverStoragePtr storage;
};

class ICoverLibrary
{
public:
    virtual ~ICoverLibrary() = default;

    /**
     * @brief initialize Opens the database and creates the covers folders
     *
     * This must be called before any other method.
     */
    virtual InitializeResult initialize() = 0;
    virtual bool isInitialized() const = 0;
    virtual void setVerbosity( LogLevel v ) = 0;

    /**
     * @brief migrateInlineToFiles Writes all inline covers to files
     *
     * Only rows with an inline payload and no path are considered, so this is
     * safe to call again after a partial failure. Inline payloads are left
     * untouched; see clearInlineAfterMigration.
     * @throw std::system_error if the database lock can't be acquired
     */
    virtual MigrationProgress migrateInlineToFiles() = 0;

    /**
     * @brief syncPathsFromFiles Points the database to cover files found on disk
     * @param coversRoot A folder containing tracks/ and albums/ subfolders. The
     *                   files in them are expected to be named <id>.<ext>
     *
     * Files which don't match any entity are silently ignored.
     */
    virtual MigrationProgress syncPathsFromFiles( const std::string& coversRoot ) = 0;

    /**
     * @brief mergeDuplicateCovers Makes all tracks of an album that have a
     *        byte-identical cover share a single file, and removes the others
     */
    virtual MergeResult mergeDuplicateCovers() = 0;

    /**
     * @brief clearInlineAfterMigration Drops inline payloads of all rows that
     *        have a cover path
     * @return The number of cleared rows
     *
     * This is destructive. Only call it once the migration and/or the sync
     * are known to have succeeded.
     */
    virtual uint64_t clearInlineAfterMigration() = 0;

    /**
     * @brief cleanupOrphanedCovers Removes the cover files that no track or
     *        album points to
     * @return The number of removed files
     */
    virtual uint64_t cleanupOrphanedCovers() = 0;

    /**
     * @brief trackCoverPath Returns the cover path of a track, or an empty
     *        string if it has none
     */
    virtual std::string trackCoverPath( int64_t trackId ) const = 0;
    /**
     * @brief batchCoverPaths Returns the cover paths for a set of tracks
     *
     * Tracks without a cover path are omitted from the result
     */
    virtual std::unordered_map<int64_t, std::string>
    batchCoverPaths( const std::vector<int64_t>& trackIds ) const = 0;
    virtual std::string albumArtPath( int64_t albumId ) const = 0;
};

}

extern "C"
{
    /**
     * @brief NewCoverLibrary Creates a cover library instance
     * @param dbPath The path to the database.
     * @param coversRoot The folder in which covers are stored
     * @param cfg A pointer to additional configurations. Can be nullptr
     * @return A cover library instance
     * \see{SetupConfig}
     */
    coverlibrary::ICoverLibrary* NewCoverLibrary( const char* dbPath,
                                                  const char* coversRoot,
                                                  const coverlibrary::SetupConfig* cfg );
}
