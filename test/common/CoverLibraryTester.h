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

#include "CoverLibrary.h"
#include "Album.h"
#include "Track.h"

#include <memory>

using namespace coverlibrary;

class CoverLibraryTester : public CoverLibrary
{
public:
    CoverLibraryTester( const std::string& dbPath, const std::string& coversRoot,
                        const SetupConfig* cfg = nullptr );

    int64_t addTrack( const std::string& title, const std::string& album,
                      const std::vector<uint8_t>& inlineCover = {},
                      const std::string& coverPath = {} );
    int64_t addAlbum( const std::string& title,
                      const std::vector<uint8_t>& inlineArt = {},
                      const std::string& artPath = {} );
    std::unique_ptr<Track> track( int64_t id );
    std::unique_ptr<Album> album( int64_t id );
    std::vector<Track> tracks();
    std::vector<Album> albums();
    /*
     * Runs an arbitrary request, mostly to install triggers which simulate
     * database failures
     */
    void execute( const std::string& req );
    void setModelVersion( uint32_t version );
};
