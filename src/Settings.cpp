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

#include "Settings.h"

#include "database/SqliteTools.h"

namespace coverlibrary
{

const uint32_t Settings::DbModelVersion = 1u;

Settings::Settings( sqlite::Connection* dbConn )
    : m_dbConn( dbConn )
    , m_dbModelVersion( 0 )
{
}

void Settings::load()
{
    OPEN_WRITE_CONTEXT( ctx, m_dbConn );
    sqlite::Statement s( "SELECT db_model_version FROM Settings" );
    s.execute();
    auto row = s.row();
    // First launch: no settings
    if ( row == nullptr )
    {
        sqlite::Tools::executeInsert( m_dbConn,
                "INSERT INTO Settings(db_model_version) VALUES(?)",
                DbModelVersion );
        m_dbModelVersion = DbModelVersion;
        return;
    }
    row >> m_dbModelVersion;
    while ( s.row() != nullptr )
        LOG_WARN( "Ignoring extra Settings row" );
}

uint32_t Settings::dbModelVersion() const
{
    return m_dbModelVersion;
}

void Settings::createTable( sqlite::Connection* dbConn )
{
    const std::string req = "CREATE TABLE IF NOT EXISTS Settings("
                "db_model_version UNSIGNED INTEGER NOT NULL DEFAULT 1"
            ")";
    sqlite::Tools::executeRequest( dbConn, req );
}

}
