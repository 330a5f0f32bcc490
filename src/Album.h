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

#include <cstdint>
#include <string>
#include <vector>

#include "CoverState.h"
#include "database/SqliteTraits.h"

namespace coverlibrary
{

namespace sqlite
{
class Connection;
class Row;
}

class Album
{
public:
    struct Table
    {
        static const std::string Name;
        static const std::string PrimaryKeyColumn;
    };

    explicit Album( sqlite::Row& row );

    int64_t id() const;
    const std::string& title() const;
    const sqlite::Blob& inlineArt() const;
    const std::string& artPath() const;
    CoverState coverState() const;

    static void createTable( sqlite::Connection* dbConn );
    static int64_t create( sqlite::Connection* dbConn, const std::string& title,
                           const sqlite::Blob& inlineArt,
                           const std::string& artPath );

    static std::vector<Album> fetchAll( sqlite::Connection* dbConn );
    static std::vector<Album> fetchMigrationCandidates( sqlite::Connection* dbConn );
    /**
     * @brief setArtPath Updates an album art path
     * @return The number of affected rows, 0 if the album doesn't exist
     * @throw sqlite::errors::Exception
     */
    static int64_t setArtPath( sqlite::Connection* dbConn, int64_t albumId,
                               const std::string& path );
    static std::string artPath( sqlite::Connection* dbConn, int64_t albumId );
    static int64_t clearInlineArt( sqlite::Connection* dbConn );
    static std::vector<std::string> referencedPaths( sqlite::Connection* dbConn );

private:
    int64_t m_id;
    std::string m_title;
    sqlite::Blob m_inlineArt;
    std::string m_artPath;
};

}
