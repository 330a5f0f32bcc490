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

#include <cassert>
#include <chrono>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <unordered_map>
#include <vector>

#include "database/SqliteConnection.h"
#include "database/SqliteErrors.h"
#include "database/SqliteTraits.h"
#include "database/SqliteTransaction.h"
#include "logging/Logger.h"

namespace coverlibrary
{

namespace sqlite
{

class Row
{
public:
    explicit Row( sqlite3_stmt* stmt );

    constexpr Row()
        : m_stmt( nullptr )
        , m_idx( 0 )
        , m_nbColumns( 0 )
    {
    }

    /**
     * @brief extract Returns the next value and advances to the next column
     */
    template <typename T>
    T extract()
    {
        if ( m_idx >= m_nbColumns )
            throw errors::ColumnOutOfRange( m_idx, m_nbColumns );
        auto t = sqlite::Traits<T>::Load( m_stmt, m_idx );
        m_idx++;
        return t;
    }

    /**
     * @brief operator >> Extracts the next column from this result row.
     */
    template <typename T>
    Row& operator>>( T& t )
    {
        if ( m_idx >= m_nbColumns )
            throw errors::ColumnOutOfRange( m_idx, m_nbColumns );
        t = sqlite::Traits<T>::Load( m_stmt, m_idx );
        m_idx++;
        return *this;
    }

    /**
     * @brief Returns the value in column idx, but doesn't advance to the next column
     */
    template <typename T>
    T load( unsigned int idx ) const
    {
        if ( idx >= m_nbColumns )
            throw errors::ColumnOutOfRange( idx, m_nbColumns );
        return sqlite::Traits<T>::Load( m_stmt, idx );
    }

    /**
     * @brief isNull Returns true if the value in column idx is NULL
     */
    bool isNull( unsigned int idx ) const;

    unsigned int nbColumns() const;

    bool operator==(std::nullptr_t) const;

    bool operator!=(std::nullptr_t) const;

private:
    sqlite3_stmt* m_stmt;
    unsigned int m_idx;
    unsigned int m_nbColumns;
};

class Statement
{
public:
    Statement( Connection::Handle dbConnection, const std::string& req );

    explicit Statement( const std::string& req );

    template <typename... Args>
    void execute( Args&&... args )
    {
        m_bindIdx = 1;
        (void)std::initializer_list<bool>{ _bind( std::forward<Args>( args ) )... };
    }

    Row row();

    static void FlushStatementCache();

    static void FlushConnectionStatementCache( Connection::Handle h );

private:
    template <typename T>
    bool _bind( T&& value )
    {
        auto res = Traits<T>::Bind( m_stmt.get(), m_bindIdx,
                                    std::forward<T>( value ) );
        if ( res != SQLITE_OK )
        {
            auto sqlStr = sqlite3_sql( m_stmt.get() );
            errors::mapToException( sqlStr, sqlite3_errmsg( m_dbConn ), res );
        }
        m_bindIdx++;
        return true;
    }

private:
    // Used during the connection lifetime. This holds a compiled request
    using CachedStmtPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;
    // Used for the current statement execution, this
    // basically holds the state of the currently executed request.
    using StatementPtr = std::unique_ptr<sqlite3_stmt, void(*)(sqlite3_stmt*)>;
    StatementPtr m_stmt;
    Connection::Handle m_dbConn;
    int m_bindIdx;
    bool m_isCommit;
    static std::mutex StatementsCacheLock;
    using StatementsCacheMap = std::unordered_map<std::string, CachedStmtPtr>;
    static std::unordered_map<Connection::Handle, StatementsCacheMap> StatementsCache;
};

class Tools
{
    public:
        /**
         * Will fetch all records of type T, constructing each of them from
         * a sqlite::Row
         */
        template <typename T, typename... Args>
        static std::vector<T> fetchAll( sqlite::Connection* dbConnection,
                                        const std::string& req,
                                        Args&&... args )
        {
            OPEN_READ_CONTEXT( ctx, dbConnection );
            auto chrono = std::chrono::steady_clock::now();

            std::vector<T> results;
            Statement stmt( Connection::Context::handle(), req );
            stmt.execute( std::forward<Args>( args )... );
            Row sqliteRow;
            while ( ( sqliteRow = stmt.row() ) != nullptr )
                results.emplace_back( sqliteRow );
            auto duration = std::chrono::steady_clock::now() - chrono;
            LOG_VERBOSE( "Executed ", req, " in ",
                std::chrono::duration_cast<std::chrono::microseconds>( duration ).count(), "µs" );
            return results;
        }

        /**
         * Fetches a single column from the first row returned by the request.
         * Returns a default constructed value if no row was returned.
         */
        template <typename T, typename... Args>
        static T fetchScalar( sqlite::Connection* dbConnection,
                              const std::string& req, Args&&... args )
        {
            OPEN_READ_CONTEXT( ctx, dbConnection );
            Statement stmt( Connection::Context::handle(), req );
            stmt.execute( std::forward<Args>( args )... );
            auto row = stmt.row();
            T res{};
            if ( row != nullptr )
                res = row.load<T>( 0 );
            while ( stmt.row() != nullptr )
                ;
            return res;
        }

        template <typename... Args>
        static void executeRequest( sqlite::Connection* dbConnection,
                                    const std::string& req, Args&&... args )
        {
            OPEN_WRITE_CONTEXT( ctx, dbConnection );
            executeRequestLocked( Connection::Context::handle(), req, std::forward<Args>( args )... );
        }

        /**
         * Runs an UPDATE or DELETE request and returns the number of modified
         * rows. Failures are reported as sqlite::errors::Exception
         */
        template <typename... Args>
        static int64_t executeUpdate( sqlite::Connection* dbConnection,
                                      const std::string& req,
                                      Args&&... args )
        {
            OPEN_WRITE_CONTEXT( ctx, dbConnection );
            auto handle = Connection::Context::handle();
            executeRequestLocked( handle, req, std::forward<Args>( args )... );
            return sqlite3_changes( handle );
        }

        /**
         * Inserts a record to the DB and return the newly created primary key.
         */
        template <typename... Args>
        static int64_t executeInsert( sqlite::Connection* dbConnection,
                                      const std::string& req,
                                      Args&&... args )
        {
            OPEN_WRITE_CONTEXT( ctx, dbConnection );
            auto handle = Connection::Context::handle();
            executeRequestLocked( handle, req, std::forward<Args>( args )... );
            return sqlite3_last_insert_rowid( handle );
        }

        static std::vector<std::string> listTables( sqlite::Connection* dbConn );

    private:
        template <typename... Args>
        static void executeRequestLocked( sqlite::Connection::Handle handle,
                                          const std::string& req, Args&&... args )
        {
            auto chrono = std::chrono::steady_clock::now();
            Statement stmt( handle, req );
            stmt.execute( std::forward<Args>( args )... );
            while ( stmt.row() != nullptr )
                ;
            auto duration = std::chrono::steady_clock::now() - chrono;
            LOG_VERBOSE( "Executed ", req, " in ",
                std::chrono::duration_cast<std::chrono::microseconds>( duration ).count(), "µs" );
        }
};

}

}
