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
#include <unordered_map>
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

class Track
{
public:
    struct Table
    {
        static const std::string Name;
        static const std::string PrimaryKeyColumn;
    };

    explicit Track( sqlite::Row& row );

    int64_t id() const;
    const std::string& title() const;
    const std::string& album() const;
    int64_t albumId() const;
    const sqlite::Blob& inlineCover() const;
    const std::string& coverPath() const;
    CoverState coverState() const;

    static void createTable( sqlite::Connection* dbConn );

    /**
     * @brief create Inserts a new track
     * @param albumId The owning album id, or 0 if unknown
     * @param inlineCover An inline cover payload. An empty one is stored as NULL
     * @param coverPath A cover path. An empty one is stored as NULL
     * @return The new track id
     *
     * Tracks are normally created by the ingestion pipeline, this is provided
     * for tooling & tests.
     */
    static int64_t create( sqlite::Connection* dbConn, const std::string& title,
                           const std::string& album, int64_t albumId,
                           const sqlite::Blob& inlineCover,
                           const std::string& coverPath );

    static std::vector<Track> fetchAll( sqlite::Connection* dbConn );
    /**
     * @brief fetchMigrationCandidates Returns the tracks that only have an
     *        inline cover
     */
    static std::vector<Track> fetchMigrationCandidates( sqlite::Connection* dbConn );
    static std::vector<std::string> listAlbumNames( sqlite::Connection* dbConn );
    /**
     * @brief fetchCoverPathsByAlbum Returns the (id, cover path) of all tracks
     *        belonging to the provided album which are merge candidates
     */
    static std::vector<std::pair<int64_t, std::string>>
    fetchCoverPathsByAlbum( sqlite::Connection* dbConn, const std::string& album );

    /**
     * @brief setCoverPath Updates a track cover path
     * @return The number of affected rows, 0 if the track doesn't exist
     * @throw sqlite::errors::Exception
     */
    static int64_t setCoverPath( sqlite::Connection* dbConn, int64_t trackId,
                                 const std::string& path );
    static std::string coverPath( sqlite::Connection* dbConn, int64_t trackId );
    static std::unordered_map<int64_t, std::string>
    coverPaths( sqlite::Connection* dbConn, const std::vector<int64_t>& trackIds );
    /**
     * @brief clearInlineCovers Drops the inline payload of all tracks having
     *        a cover path
     * @return The number of cleared tracks
     */
    static int64_t clearInlineCovers( sqlite::Connection* dbConn );
    static std::vector<std::string> referencedPaths( sqlite::Connection* dbConn );

private:
    int64_t m_id;
    std::string m_title;
    std::string m_album;
    int64_t m_albumId;
    sqlite::Blob m_inlineCover;
    std::string m_coverPath;
};

}
