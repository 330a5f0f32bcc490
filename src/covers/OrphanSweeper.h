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

namespace coverlibrary
{

class ICoverStorage;

namespace sqlite
{
class Connection;
}

/**
 * @brief The OrphanSweeper class removes the cover files no entity points to
 */
class OrphanSweeper
{
public:
    OrphanSweeper( sqlite::Connection* dbConn, ICoverStorage* storage );

    /**
     * @brief run Removes the orphaned files from the tracks/ and albums/
     *        subfolders of coversRoot
     * @return The number of removed files
     * @throw sqlite::errors::Exception if the referenced paths can't be listed
     */
    uint64_t run( const std::string& coversRoot );

private:
    sqlite::Connection* m_dbConn;
    ICoverStorage* m_storage;
};

}
