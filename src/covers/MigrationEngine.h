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

#include "coverlibrary/Types.h"

namespace coverlibrary
{

namespace sqlite
{
class Connection;
}

/**
 * @brief The MigrationEngine class writes inline covers to files and records
 *        their path
 *
 * Tracks & albums only having an inline payload are selected under a single
 * read context, which is released before any file is written. Each path is
 * then recorded with its own short write context. Inline payloads are kept.
 */
class MigrationEngine
{
public:
    MigrationEngine( sqlite::Connection* dbConn, ICoverStorage* storage );

    /**
     * @throw std::system_error if the database lock can't be acquired
     * @throw sqlite::errors::Exception if the candidates can't be fetched
     */
    MigrationProgress run();

private:
    sqlite::Connection* m_dbConn;
    ICoverStorage* m_storage;
};

}
