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

#include "Album.h"

#include "database/SqliteTools.h"

#include <algorithm>

namespace coverlibrary
{

const std::string Album::Table::Name = "Album";
const std::string Album::Table::PrimaryKeyColumn = "id_album";

Album::Album( sqlite::Row& row )
    : m_id( row.extract<decltype(m_id)>() )
    , m_title( row.extract<decltype(m_title)>() )
    , m_inlineArt( row.extract<decltype(m_inlineArt)>() )
    , m_artPath( row.extract<decltype(m_artPath)>() )
{
}

int64_t Album::id() const
{
    return m_id;
}

const std::string& Album::title() const
{
    return m_title;
}

const sqlite::Blob& Album::inlineArt() const
{
    return m_inlineArt;
}

const std::string& Album::artPath() const
{
    return m_artPath;
}

CoverState Album::coverState() const
{
    return coverlibrary::coverState( m_inlineArt.empty() == false,
                                     m_artPath.empty() == false );
}

void Album::createTable( sqlite::Connection* dbConn )
{
    const std::string req = "CREATE TABLE IF NOT EXISTS " + Table::Name +
            "("
                "id_album INTEGER PRIMARY KEY AUTOINCREMENT,"
                "title TEXT,"
                "inline_art BLOB,"
                "art_path TEXT"
            ")";
    sqlite::Tools::executeRequest( dbConn, req );
}

int64_t Album::create( sqlite::Connection* dbConn, const std::string& title,
                       const sqlite::Blob& inlineArt, const std::string& artPath )
{
    static const std::string req = "INSERT INTO " + Table::Name +
            "(title, inline_art, art_path) VALUES(?, ?, ?)";
    return sqlite::Tools::executeInsert( dbConn, req, title, inlineArt,
                                         sqlite::NullableString{ artPath } );
}

std::vector<Album> Album::fetchAll( sqlite::Connection* dbConn )
{
    static const std::string req = "SELECT id_album, title, inline_art, art_path"
            " FROM " + Table::Name + " ORDER BY id_album";
    return sqlite::Tools::fetchAll<Album>( dbConn, req );
}

std::vector<Album> Album::fetchMigrationCandidates( sqlite::Connection* dbConn )
{
    static const std::string req = "SELECT id_album, title, inline_art, art_path"
            " FROM " + Table::Name +
            " WHERE inline_art IS NOT NULL AND length(inline_art) > 0"
            " AND (art_path IS NULL OR art_path = '')"
            " ORDER BY id_album";
    auto albums = sqlite::Tools::fetchAll<Album>( dbConn, req );
    albums.erase( std::remove_if( begin( albums ), end( albums ),
                                  []( const Album& a ) {
        return isMigrationCandidate( a.coverState() ) == false;
    }), end( albums ) );
    return albums;
}

int64_t Album::setArtPath( sqlite::Connection* dbConn, int64_t albumId,
                           const std::string& path )
{
    static const std::string req = "UPDATE " + Table::Name +
            " SET art_path = ? WHERE id_album = ?";
    return sqlite::Tools::executeUpdate( dbConn, req, path, albumId );
}

std::string Album::artPath( sqlite::Connection* dbConn, int64_t albumId )
{
    static const std::string req = "SELECT art_path FROM " + Table::Name +
            " WHERE id_album = ?";
    return sqlite::Tools::fetchScalar<std::string>( dbConn, req, albumId );
}

int64_t Album::clearInlineArt( sqlite::Connection* dbConn )
{
    static const std::string req = "UPDATE " + Table::Name +
            " SET inline_art = NULL"
            " WHERE art_path IS NOT NULL AND art_path != ''";
    return sqlite::Tools::executeUpdate( dbConn, req );
}

std::vector<std::string> Album::referencedPaths( sqlite::Connection* dbConn )
{
    static const std::string req = "SELECT DISTINCT art_path FROM " +
            Table::Name + " WHERE art_path IS NOT NULL AND art_path != ''";
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
