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

#include "coverlibrary/ICoverLibrary.h"

#include <memory>
#include <mutex>
#include <string>

namespace coverlibrary
{

namespace sqlite
{
class Connection;
}

class CoverLibrary : public ICoverLibrary
{
public:
    CoverLibrary( const std::string& dbPath, const std::string& coversRoot,
                  const SetupConfig* cfg );
    virtual ~CoverLibrary();

    virtual InitializeResult initialize() override;
    virtual bool isInitialized() const override;
    virtual void setVerbosity( LogLevel v ) override;

    virtual MigrationProgress migrateInlineToFiles() override;
    virtual MigrationProgress syncPathsFromFiles( const std::string& coversRoot ) override;
    virtual MergeResult mergeDuplicateCovers() override;
    virtual uint64_t clearInlineAfterMigration() override;
    virtual uint64_t cleanupOrphanedCovers() override;

    virtual std::string trackCoverPath( int64_t trackId ) const override;
    virtual std::unordered_map<int64_t, std::string>
    batchCoverPaths( const std::vector<int64_t>& trackIds ) const override;
    virtual std::string albumArtPath( int64_t albumId ) const override;

    sqlite::Connection* getConn() const;
    const std::string& coversRoot() const;

protected:
    virtual void onDbConnectionReady( sqlite::Connection* dbConn );
    void createAllTables();

private:
    void checkInitialized() const;

protected:
    std::shared_ptr<sqlite::Connection> m_dbConnection;

private:
    mutable std::mutex m_mutex;
    bool m_initialized;
    const std::string m_dbPath;
    const std::string m_coversRoot;
    CoverStoragePtr m_storage;
};

}
