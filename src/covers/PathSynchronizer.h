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
#include <utility>
#include <vector>

#include "coverlibrary/Types.h"

namespace coverlibrary
{

namespace sqlite
{
class Connection;
}

/**
 * @brief The PathSynchronizer class points tracks & albums to the cover files
 *        found in a covers folder
 *
 * Files are expected to be named <id>.<ext> in the tracks/ and albums/
 * subfolders. Files which don't match an existing entity are ignored.
 */
class PathSynchronizer
{
public:
    using Candidate = std::pair<int64_t, std::string>;

    explicit PathSynchronizer( sqlite::Connection* dbConn );

    /**
     * @throw std::system_error if the database lock can't be acquired
     * @throw sqlite::errors::Exception if a transaction can't be started
     */
    MigrationProgress run( const std::string& coversRoot );

    /**
     * @brief listCandidates Lists the cover files of a folder named after an id
     *
     * Only jpg, jpeg, png & webp files are considered. A missing folder yields
     * no candidates, other listing failures are appended to errors.
     */
    static std::vector<Candidate> listCandidates( const std::string& folder,
                                                  std::vector<std::string>& errors );

private:
    size_t applyTrackPaths( const std::vector<Candidate>& candidates,
                            std::vector<std::string>& errors );
    size_t applyAlbumPaths( const std::vector<Candidate>& candidates,
                            std::vector<std::string>& errors );

private:
    sqlite::Connection* m_dbConn;
};

}
