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

#include "CoverLibraryTester.h"

#include "database/SqliteTools.h"

CoverLibraryTester::CoverLibraryTester( const std::string& dbPath,
                                        const std::string& coversRoot,
                                        const SetupConfig* cfg )
    : CoverLibrary( dbPath, coversRoot, cfg )
{
}

int64_t CoverLibraryTester::addTrack( const std::string& title,
                                      const std::string& album,
                                      const std::vector<uint8_t>& inlineCover,
                                      const std::string& coverPath )
{
    return Track::create( getConn(), title, album, 0, inlineCover, coverPath );
}

int64_t CoverLibraryTester::addAlbum( const std::string& title,
                                      const std::vector<uint8_t>& inlineArt,
                                      const std::string& artPath )
{
    return Album::create( getConn(), title, inlineArt, artPath );
}

std::unique_ptr<Track> CoverLibraryTester::track( int64_t id )
{
    for ( auto& t : Track::fetchAll( getConn() ) )
    {
        if ( t.id() == id )
            return std::unique_ptr<Track>( new Track( std::move( t ) ) );
    }
    return nullptr;
}

std::unique_ptr<Album> CoverLibraryTester::album( int64_t id )
{
    for ( auto& a : Album::fetchAll( getConn() ) )
    {
        if ( a.id() == id )
            return std::unique_ptr<Album>( new Album( std::move( a ) ) );
    }
    return nullptr;
}

std::vector<Track> CoverLibraryTester::tracks()
{
    return Track::fetchAll( getConn() );
}

std::vector<Album> CoverLibraryTester::albums()
{
    return Album::fetchAll( getConn() );
}

void CoverLibraryTester::execute( const std::string& req )
{
    sqlite::Tools::executeRequest( getConn(), req );
}

void CoverLibraryTester::setModelVersion( uint32_t version )
{
    sqlite::Tools::executeUpdate( getConn(),
            "UPDATE Settings SET db_model_version = ?", version );
}
