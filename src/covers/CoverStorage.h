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

#include "coverlibrary/ICoverStorage.h"

namespace coverlibrary
{

/**
 * @brief The CoverStorage class stores covers as <root>/tracks/<id>.<ext>
 *        and <root>/albums/<id>.<ext>
 *
 * The extension is deduced from the payload signature. When a file with the
 * same id but another extension already exists, it is removed so that an id
 * never maps to more than one file.
 */
class CoverStorage : public ICoverStorage
{
public:
    static const char* const TracksFolder;
    static const char* const AlbumsFolder;

    explicit CoverStorage( std::string coversRoot );

    virtual std::string writeTrackCover( int64_t trackId,
                                         const std::vector<uint8_t>& payload ) override;
    virtual std::string writeAlbumArt( int64_t albumId,
                                       const std::vector<uint8_t>& payload ) override;
    virtual void deleteFile( const std::string& path ) override;

    const std::string& coversRoot() const;
    std::string tracksFolder() const;
    std::string albumsFolder() const;

    /**
     * @brief sniffExtension Returns the file extension matching a payload
     *
     * Recognizes jpeg, png, webp & gif. Anything else is assumed to be jpeg.
     */
    static const char* sniffExtension( const std::vector<uint8_t>& payload );

private:
    std::string write( const std::string& folder, int64_t id,
                       const std::vector<uint8_t>& payload );

private:
    std::string m_coversRoot;
};

}
