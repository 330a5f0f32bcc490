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

#include "SqliteConnection.h"

#include "database/SqliteTools.h"

#include <cassert>
#include <cerrno>
#include <cstring>
#include <strings.h>

namespace coverlibrary
{
namespace sqlite
{

thread_local Connection::Handle Connection::Context::m_handle;
thread_local Connection::Context::Type Connection::Context::m_type;

Connection::Connection( const std::string& dbPath )
    : m_dbPath( dbPath )
    , m_conn( nullptr, &sqlite3_close_v2 )
{
    sqlite3* dbConnection;
    auto flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    auto res = sqlite3_open_v2( m_dbPath.c_str(), &dbConnection, flags, nullptr );
    ConnPtr dbConn( dbConnection, &sqlite3_close_v2 );
    if ( res != SQLITE_OK )
    {
        int err = dbConnection != nullptr ? sqlite3_system_errno( dbConnection ) : 0;
        LOG_ERROR( "Failed to connect to database. OS error: ", err );
        errors::mapToException( "<connecting to db>",
                                dbConnection != nullptr ? sqlite3_errmsg( dbConnection ) : "",
                                res );
    }
    /*
     * Fetch the absolute path to the database. If for whatever reason we were
     * to change directories during the runtime, we'd end up having a connection
     * to a different database in case the provided path is relative.
     */
    m_dbPath = sqlite3_db_filename( dbConnection, nullptr );
    LOG_DEBUG( "Fetched absolute database path from sqlite: ", m_dbPath );

    res = sqlite3_extended_result_codes( dbConnection, 1 );
    if ( res != SQLITE_OK )
        errors::mapToException( "<enabling extended errors>", "", res );
    setPragma( dbConnection, "foreign_keys", "1" );
    setPragma( dbConnection, "journal_mode", "wal" );
    setPragma( dbConnection, "synchronous", "1" );
    m_conn = std::move( dbConn );
}

Connection::~Connection()
{
    sqlite::Statement::FlushConnectionStatementCache( m_conn.get() );
}

std::unique_ptr<sqlite::Transaction> Connection::newTransaction()
{
    if ( sqlite::Transaction::isInProgress() == false )
        return std::unique_ptr<sqlite::Transaction>{ new sqlite::ActualTransaction( this ) };
    return std::unique_ptr<sqlite::Transaction>{ new sqlite::NoopTransaction() };
}

Connection::ReadContext Connection::acquireReadContext()
{
    assert( Context::isOpened( Context::Type::Read ) == false );
    return ReadContext{ this };
}

Connection::WriteContext Connection::acquireWriteContext()
{
    assert( Context::isOpened( Context::Type::Write ) == false );
    return WriteContext{ this };
}

void Connection::setPragma( Connection::Handle conn, const std::string& pragmaName,
                            const std::string& value )
{
    std::string reqBase = std::string{ "PRAGMA " } + pragmaName;
    std::string reqSet = reqBase + " = " + value;

    {
        // journal_mode returns the new mode as a row, the others don't return
        // anything
        sqlite::Statement stmt( conn, reqSet );
        stmt.execute();
        while ( stmt.row() != nullptr )
            ;
    }

    sqlite::Statement stmtCheck( conn, reqBase );
    stmtCheck.execute();
    auto resultRow = stmtCheck.row();
    std::string resultValue;
    resultRow >> resultValue;
    while ( stmtCheck.row() != nullptr )
        ;
    if ( strcasecmp( resultValue.c_str(), value.c_str() ) != 0 )
    {
        // In memory databases can't use WAL, this isn't fatal
        if ( pragmaName == "journal_mode" )
        {
            LOG_WARN( "Failed to enable WAL journal mode, using ", resultValue );
            return;
        }
        throw std::runtime_error( "PRAGMA " + pragmaName + " value mismatch" );
    }
}

bool Connection::checkSchemaIntegrity()
{
    OPEN_READ_CONTEXT( ctx, this );
    std::string req = std::string{ "PRAGMA integrity_check" };

    sqlite::Statement stmt( Context::handle(), req );
    stmt.execute();
    auto row = stmt.row();
    if ( row.load<std::string>( 0 ) == "ok" )
    {
        while ( stmt.row() != nullptr )
            ;
        return true;
    }
    do
    {
        LOG_ERROR( "Error string from integrity_check: ", row.load<std::string>( 0 ) );
        row = stmt.row();
    }
    while ( row != nullptr );
    return false;
}

const std::string& Connection::dbPath() const
{
    return m_dbPath;
}

std::shared_ptr<Connection> Connection::connect( const std::string& dbPath )
{
    // Use a wrapper to allow make_shared to use the private Connection ctor
    struct SqliteConnectionWrapper : public Connection
    {
        explicit SqliteConnectionWrapper( const std::string& p ) : Connection( p ) {}
    };
    return std::make_shared<SqliteConnectionWrapper>( dbPath );
}

Connection::Context::~Context()
{
    releaseHandle();
}

Connection::Handle Connection::Context::handle()
{
    assert( m_handle != nullptr );
    return m_handle;
}

bool Connection::Context::isOpened( Type t )
{
    if ( m_handle == nullptr )
        return false;
    switch ( m_type )
    {
    case Type::None:
        assert( !"Context type can't be none if a handle is available" );
        return false;
    case Type::Write:
        /*
         * If a write context is already opened, it has an exclusive access and can
         * be used to execute read requests
         */
        return true;
    case Type::Read:
        /*
         * We can't open a write context if a read context is created.
         * The only configuration we support is to recursively create a context
         * of the same type.
         */
        assert( t == Type::Read );
        return true;
    }
    return false;
}

void Connection::Context::connect( Connection* c, Type t )
{
    assert( m_handle == nullptr );
    m_handle = c->m_conn.get();
    m_type = t;
    assert( m_handle != nullptr );
    m_owning = true;
}

void Connection::Context::releaseHandle()
{
    /*
     * We don't want to unset the current thread's context when destroying
     * a default constructed Context
     */
    if ( m_owning == false )
        return;
    assert( m_handle != nullptr );
    m_handle = nullptr;
    m_type = Type::None;
    m_owning = false;
}

Connection::Context::Context( Context&& ctx ) noexcept
{
    *this = std::move( ctx );
}

Connection::Context& Connection::Context::operator=( Context&& ctx ) noexcept
{
    m_owning = ctx.m_owning;
    ctx.m_owning = false;
    return *this;
}

Connection::ReadContext::ReadContext( Connection* c )
    : m_lock( c->m_contextLock )
{
    connect( c, Type::Read );
}

Connection::WriteContext::WriteContext( Connection* c )
    : m_lock( c->m_contextLock )
{
    connect( c, Type::Write );
}

void Connection::WriteContext::unlock()
{
    releaseHandle();
    m_lock.unlock();
}

}

}
