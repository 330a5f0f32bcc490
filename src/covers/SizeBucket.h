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
#include <map>
#include <string>
#include <vector>

namespace coverlibrary
{

struct CoverFile
{
    std::string path;
    uint64_t size;
};

/**
 * @brief The SizeBuckets class groups files by their size in KiB (rounded
 *        down)
 *
 * Files with different bucket keys can't be identical, so only buckets
 * holding at least 2 files need to be hashed.
 */
class SizeBuckets
{
public:
    static uint64_t keyFor( uint64_t sizeBytes );

    void add( std::string path, uint64_t sizeBytes );
    /**
     * @brief hashCandidates Returns the buckets containing at least 2 files
     */
    std::vector<std::vector<CoverFile>> hashCandidates() const;
    size_t nbBuckets() const;
    size_t nbFiles() const;

private:
    std::map<uint64_t, std::vector<CoverFile>> m_buckets;
};

}
