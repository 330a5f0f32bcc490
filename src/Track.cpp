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

#include "Track.h"

#include "database/SqliteTools.h"

#include <algorithm>

namespace coverlibrary
{

const std::string Track::Table::Name = "Track";
const std::string Track::Table::PrimaryKeyColumn = "id_track";

Track::Track( sqlite::Row& row )
    : m_id( row.extract<decltype(m_id)>() )
    , m_title( row.extract<decltype(m_title)>() )
    , m_album( row.extract<decltype(m_album)>() )
    , m_albumId( row.extract<decltype(m_albumId)>() )
    , m_inlineCover( row.extract<decltype(m_inlineCover)>() )
    , m_coverPath( row.extract<decltype(m_coverPath)>() )
{
}

int64_t Track::id() const
{
    return m_id;
}

const std::string& Track::title() const
{
    return m_title;
}

const std::string& Track::album() const
{
    return m_album;
}

int64_t Track::albumId() const
{
    return m_albumId;
}

const sqlite::Blob& Track::inlineCover() const
{
    return m_inlineCover;
}

const std::string& Track::coverPath() const
{
    return m_coverPath;
}

CoverState Track::coverState() const
{
    return coverlibrary::coverState( m_inlineCover.empty() == false,
                                     m_coverPath.empty() == false );
}

void Track::createTable( sqlite::Connection* dbConn )
{
    const std::string req = "CREATE TABLE IF NOT EXISTS " + Table::Name +
            "("
                "id_track INTEGER PRIMARY KEY AUTOINCREMENT,"
                "title TEXT,"
                "album TEXT,"
                "album_id INTEGER,"
                "inline_cover BLOB,"
                "cover_path TEXT"
            ")";
    const std::string indexReq = "CREATE INDEX IF NOT EXISTS track_album_idx "
            "ON " + Table::Name + "(album)";
    sqlite::Tools::executeRequest( dbConn, req );
    sqlite::Tools::executeRequest( dbConn, indexReq );
}

int64_t Track::create( sqlite::Connection* dbConn, const std::string& title,
                       const std::string& album, int64_t albumId,
                       const sqlite::Blob& inlineCover,
                       const std::string& coverPath )
{
    static const std::string req = "INSERT INTO " + Table::Name +
            "(title, album, album_id, inline_cover, cover_path) "
            "VALUES(?, ?, ?, ?, ?)";
    return sqlite::Tools::executeInsert( dbConn, req, title,
                                         sqlite::NullableString{ album },
                                         sqlite::ForeignKey{ albumId },
                                         inlineCover,
                                         sqlite::NullableString{ coverPath } );
}

std::vector<Track> Track::fetchAll( sqlite::Connection* dbConn )
{
    static const std::string req = "SELECT id_track, title, album, album_id, "
            "inline_cover, cover_path FROM " + Table::Name +
            " ORDER BY id_track";
    return sqlite::Tools::fetchAll<Track>( dbConn, req );
}

std::vector<Track> Track::fetchMigrationCandidates( sqlite::Connection* dbConn )
{
    static const std::string req = "SELECT id_track, title, album, album_id, "
            "inline_cover, cover_path FROM " + Table::Name +
            " WHERE inline_cover IS NOT NULL AND length(inline_cover) > 0"
            " AND (cover_path IS NULL OR cover_path = '')"
            " ORDER BY id_track";
    auto tracks = sqlite::Tools::fetchAll<Track>( dbConn, req );
    tracks.erase( std::remove_if( begin( tracks ), end( tracks ),
                                  []( const Track& t ) {
        return isMigrationCandidate( t.coverState() ) == false;
    }), end( tracks ) );
    return tracks;
}

std::vector<std::string> Track::listAlbumNames( sqlite::Connection* dbConn )
{
    static const std::string req = "SELECT DISTINCT album FROM " + Table::Name +
            " WHERE album IS NOT NULL ORDER BY album";
    OPEN_READ_CONTEXT( ctx, dbConn );
    sqlite::Statement stmt( req );
    stmt.execute();
    std::vector<std::string> albums;
    sqlite::Row row;
    while ( ( row = stmt.row() ) != nullptr )
        albums.push_back( row.extract<std::string>() );
    return albums;
}

std::vector<std::pair<int64_t, std::string>>
Track::fetchCoverPathsByAlbum( sqlite::Connection* dbConn, const std::string& album )
{
    static const std::string req = "SELECT id_track, cover_path,"
            " inline_cover IS NOT NULL AND length(inline_cover) > 0"
            " FROM " + Table::Name + " WHERE album = ? AND cover_path IS NOT NULL"
            " AND cover_path != '' ORDER BY id_track";
    OPEN_READ_CONTEXT( ctx, dbConn );
    sqlite::Statement stmt( req );
    stmt.execute( album );
    std::vector<std::pair<int64_t, std::string>> res;
    sqlite::Row row;
    while ( ( row = stmt.row() ) != nullptr )
    {
        auto id = row.extract<int64_t>();
        auto path = row.extract<std::string>();
        auto hasInline = row.extract<bool>();
        if ( isMergeCandidate( coverlibrary::coverState( hasInline,
                                        path.empty() == false ) ) == false )
            continue;
        res.emplace_back( id, std::move( path ) );
    }
    return res;
}

int64_t Track::setCoverPath( sqlite::Connection* dbConn, int64_t trackId,
                             const std::string& path )
{
    static const std::string req = "UPDATE " + Table::Name +
            " SET cover_path = ? WHERE id_track = ?";
    return sqlite::Tools::executeUpdate( dbConn, req, path, trackId );
}

std::string Track::coverPath( sqlite::Connection* dbConn, int64_t trackId )
{
    static const std::string req = "SELECT cover_path FROM " + Table::Name +
            " WHERE id_track = ?";
    return sqlite::Tools::fetchScalar<std::string>( dbConn, req, trackId );
}

std::unordered_map<int64_t, std::string>
Track::coverPaths( sqlite::Connection* dbConn, const std::vector<int64_t>& trackIds )
{
    static const std::string req = "SELECT cover_path FROM " + Table::Name +
            " WHERE id_track = ?";
    std::unordered_map<int64_t, std::string> res;
    OPEN_READ_CONTEXT( ctx, dbConn );
    for ( auto id : trackIds )
    {
        sqlite::Statement stmt( req );
        stmt.execute( id );
        auto row = stmt.row();
        if ( row == nullptr )
            continue;
        auto path = row.extract<std::string>();
        while ( stmt.row() != nullptr )
            ;
        if ( path.empty() == false )
            res.emplace( id, std::move( path ) );
    }
    return res;
}

int64_t Track::clearInlineCovers( sqlite::Connection* dbConn )
{
    static const std::string req = "UPDATE " + Table::Name +
            " SET inline_cover = NULL"
            " WHERE cover_path IS NOT NULL AND cover_path != ''";
    return sqlite::Tools::executeUpdate( dbConn, req );
}

std::vector<std::string> Track::referencedPaths( sqlite::Connection* dbConn )
{
    static const std::string req = "SELECT DISTINCT cover_path FROM " +
            Table::Name + " WHERE cover_path IS NOT NULL AND cover_path != ''";
    OPEN_READ_CONTEXT( ctx, dbConn );
    sqlite::Statement stmt( req );
    stmt.execute();
    std::vector<std::string> paths;
    sqlite::Row row;
    while ( ( row = stmt.row() ) != nullptr )
        paths.push_back( row.extract<std::string>() );
    return paths;
}

}
