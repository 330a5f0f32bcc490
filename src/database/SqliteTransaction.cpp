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
#include "SqliteTransaction.h"

#include "SqliteTools.h"

namespace coverlibrary
{

namespace sqlite
{

thread_local Transaction* Transaction::CurrentTransaction = nullptr;

bool Transaction::isInProgress()
{
    return CurrentTransaction != nullptr;
}

ActualTransaction::ActualTransaction( sqlite::Connection* dbConn )
    : m_dbConn( dbConn )
    , m_ctx( dbConn )
{
    assert( CurrentTransaction == nullptr );
    // EXCLUSIVE: engines read then write in the same transaction
    run( "BEGIN EXCLUSIVE" );
    LOG_VERBOSE( "Opened transaction on ", m_dbConn->dbPath() );
    CurrentTransaction = this;
}

void ActualTransaction::commit()
{
    assert( CurrentTransaction == this );
    auto chrono = std::chrono::steady_clock::now();
    run( "COMMIT" );
    CurrentTransaction = nullptr;
    m_ctx.unlock();
    auto duration = std::chrono::steady_clock::now() - chrono;
    LOG_VERBOSE( "Committed transaction on ", m_dbConn->dbPath(), " in ",
                 std::chrono::duration_cast<std::chrono::microseconds>( duration ).count(),
                 "µs" );
}

ActualTransaction::~ActualTransaction()
{
    if ( CurrentTransaction != this )
        return;
    LOG_DEBUG( "Rolling back uncommitted transaction on ", m_dbConn->dbPath() );
    try
    {
        run( "ROLLBACK" );
    }
    catch ( const errors::Exception& ex )
    {
        // SQLite may already have rolled back on its own after an I/O or
        // memory error, in which case there is nothing left to undo
        LOG_WARN( "Rollback on ", m_dbConn->dbPath(), " failed: ", ex.what() );
    }
    CurrentTransaction = nullptr;
}

void ActualTransaction::run( const char* req )
{
    Statement s( m_ctx.handle(), req );
    s.execute();
    while ( s.row() != nullptr )
        ;
}

NoopTransaction::NoopTransaction()
{
    assert( Transaction::isInProgress() == true );
}

NoopTransaction::~NoopTransaction()
{
    assert( Transaction::isInProgress() == true );
}

void NoopTransaction::commit()
{
}

}

}
