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

namespace coverlibrary
{

/**
 * @brief The ICoverStorage class persists cover payloads to files
 *
 * Files are keyed by the owning entity id, not by their content. All methods
 * throw an fs::errors::Exception (or a subclass) on failure.
 */
class ICoverStorage
{
public:
    virtual ~ICoverStorage() = default;

    /**
     * @brief writeTrackCover Writes a track cover payload to disk
     * @param trackId The owning track id
     * @param payload The raw image bytes
     * @return The path of the written file
     */
    virtual std::string writeTrackCover( int64_t trackId,
                                         const std::vector<uint8_t>& payload ) = 0;
    /**
     * @brief writeAlbumArt Writes an album art payload to disk
     * @param albumId The owning album id
     * @param payload The raw image bytes
     * @return The path of the written file
     */
    virtual std::string writeAlbumArt( int64_t albumId,
                                       const std::vector<uint8_t>& payload ) = 0;
    /**
     * @brief deleteFile Removes a cover file
     * @param path The file to remove. An empty path is a no-op.
     *
     * A missing file is reported as a fs::errors::System whose isNotFound()
     * returns true.
     */
    virtual void deleteFile( const std::string& path ) = 0;
};

}
