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
#include <cstdlib>
#include <string>
#include <vector>

static inline std::string getTempDir()
{
    auto forcedPath = getenv( "COVERLIB_TEST_FOLDER" );
    if ( forcedPath != nullptr )
        return forcedPath;
    return "/tmp/";
}

/*
 * Builds a jpeg looking payload of the provided size. Payloads built with
 * different seeds have different content.
 */
static inline std::vector<uint8_t> makeJpeg( size_t size, uint8_t seed = 0 )
{
    std::vector<uint8_t> res( size < 4 ? 4 : size );
    res[0] = 0xFF;
    res[1] = 0xD8;
    res[2] = 0xFF;
    res[3] = 0xE0;
    for ( auto i = 4u; i < res.size(); ++i )
        res[i] = static_cast<uint8_t>( ( i * 31 + seed ) & 0xFF );
    return res;
}

static inline std::vector<uint8_t> makePng( size_t size, uint8_t seed = 0 )
{
    static const uint8_t magic[] = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };
    std::vector<uint8_t> res( size < sizeof( magic ) ? sizeof( magic ) : size );
    for ( auto i = 0u; i < res.size(); ++i )
    {
        if ( i < sizeof( magic ) )
            res[i] = magic[i];
        else
            res[i] = static_cast<uint8_t>( ( i * 7 + seed ) & 0xFF );
    }
    return res;
}
