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

#include <string>
#include <unordered_map>
#include <vector>

#include "coverlibrary/Types.h"
#include "covers/SizeBucket.h"

namespace coverlibrary
{

namespace sqlite
{
class Connection;
}

/**
 * @brief The DuplicateMerger class makes tracks of a same album share a
 *        single file when their covers are byte-identical
 *
 * Albums are processed one at a time, using the tracks' album name. Files are
 * first bucketed by size so that only files which could be identical get
 * hashed. For each group of identical files, the lexicographically smallest
 * path is kept, the tracks are pointed to it in a single transaction, then
 * the other files are removed.
 */
class DuplicateMerger
{
public:
    DuplicateMerger( sqlite::Connection* dbConn, ICoverStorage* storage );

    /**
     * @throw std::system_error if the database lock can't be acquired
     * @throw sqlite::errors::Exception if the albums can't be listed or if a
     *        transaction can't be started
     */
    MergeResult run();

    /**
     * @brief findDuplicates Returns the groups of identical files, each of
     *        them sorted by path
     * @param files The files to consider
     * @param errors Hashing failures are appended to this, and the file
     *               is ignored
     */
    static std::vector<std::vector<CoverFile>>
    findDuplicates( const std::vector<CoverFile>& files,
                    std::vector<std::string>& errors );

private:
    void mergeAlbum( const std::string& album, MergeResult& result );

private:
    sqlite::Connection* m_dbConn;
    ICoverStorage* m_storage;
};

}
