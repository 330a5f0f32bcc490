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

#include "SizeBucket.h"

namespace coverlibrary
{

uint64_t SizeBuckets::keyFor( uint64_t sizeBytes )
{
    return sizeBytes / 1024;
}

void SizeBuckets::add( std::string path, uint64_t sizeBytes )
{
    m_buckets[keyFor( sizeBytes )].push_back( CoverFile{ std::move( path ), sizeBytes } );
}

std::vector<std::vector<CoverFile>> SizeBuckets::hashCandidates() const
{
    std::vector<std::vector<CoverFile>> res;
    for ( const auto& p : m_buckets )
    {
        if ( p.second.size() >= 2 )
            res.push_back( p.second );
    }
    return res;
}

size_t SizeBuckets::nbBuckets() const
{
    return m_buckets.size();
}

size_t SizeBuckets::nbFiles() const
{
    size_t res = 0;
    for ( const auto& p : m_buckets )
        res += p.second.size();
    return res;
}

}
