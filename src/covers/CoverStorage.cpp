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

#include "CoverStorage.h"

#include "coverlibrary/filesystem/Errors.h"
#include "logging/Logger.h"
#include "utils/Directory.h"
#include "utils/File.h"
#include "utils/Filename.h"

#include <cerrno>
#include <cstring>
#include <initializer_list>

namespace coverlibrary
{

const char* const CoverStorage::TracksFolder = "tracks";
const char* const CoverStorage::AlbumsFolder = "albums";

namespace
{

bool startsWith( const std::vector<uint8_t>& payload, const uint8_t* magic,
                 size_t size, size_t offset = 0 )
{
    if ( payload.size() < offset + size )
        return false;
    return memcmp( payload.data() + offset, magic, size ) == 0;
}

}

CoverStorage::CoverStorage( std::string coversRoot )
    : m_coversRoot( utils::file::toFolderPath( std::move( coversRoot ) ) )
{
}

std::string CoverStorage::writeTrackCover( int64_t trackId,
                                           const std::vector<uint8_t>& payload )
{
    return write( tracksFolder(), trackId, payload );
}

std::string CoverStorage::writeAlbumArt( int64_t albumId,
                                         const std::vector<uint8_t>& payload )
{
    return write( albumsFolder(), albumId, payload );
}

void CoverStorage::deleteFile( const std::string& path )
{
    if ( path.empty() == true )
        return;
    utils::fs::remove( path );
    LOG_DEBUG( "Removed cover file ", path );
}

const std::string& CoverStorage::coversRoot() const
{
    return m_coversRoot;
}

std::string CoverStorage::tracksFolder() const
{
    return m_coversRoot + TracksFolder + '/';
}

std::string CoverStorage::albumsFolder() const
{
    return m_coversRoot + AlbumsFolder + '/';
}

const char* CoverStorage::sniffExtension( const std::vector<uint8_t>& payload )
{
    static const uint8_t jpeg[] = { 0xFF, 0xD8, 0xFF };
    static const uint8_t png[] = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };
    static const uint8_t riff[] = { 'R', 'I', 'F', 'F' };
    static const uint8_t webp[] = { 'W', 'E', 'B', 'P' };
    static const uint8_t gif[] = { 'G', 'I', 'F', '8' };

    if ( startsWith( payload, png, sizeof( png ) ) )
        return "png";
    if ( startsWith( payload, riff, sizeof( riff ) ) &&
         startsWith( payload, webp, sizeof( webp ), 8 ) )
        return "webp";
    if ( startsWith( payload, gif, sizeof( gif ) ) )
        return "gif";
    if ( startsWith( payload, jpeg, sizeof( jpeg ) ) == false )
        LOG_DEBUG( "Unknown cover signature, assuming jpeg" );
    return "jpg";
}

std::string CoverStorage::write( const std::string& folder, int64_t id,
                                 const std::vector<uint8_t>& payload )
{
    if ( payload.empty() == true )
        throw fs::errors::Exception{ "Refusing to write an empty cover for #" +
                                     std::to_string( id ) };
    if ( utils::fs::mkdir( folder ) == false )
        throw fs::errors::System{ errno, "Failed to create " + folder };

    auto stem = std::to_string( id );
    auto path = folder + stem + '.' + sniffExtension( payload );

    // Only keep one file per id
    for ( const auto ext : { "jpg", "jpeg", "png", "webp", "gif" } )
    {
        auto sibling = folder + stem + '.' + ext;
        if ( sibling == path )
            continue;
        try
        {
            utils::fs::remove( sibling );
            LOG_DEBUG( "Removed stale cover ", sibling );
        }
        catch ( const fs::errors::System& ex )
        {
            if ( ex.isNotFound() == false )
                throw;
        }
    }
    utils::fs::writeFile( path, payload );
    LOG_DEBUG( "Wrote ", payload.size(), " bytes to ", path );
    return path;
}

}
