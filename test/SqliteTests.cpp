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

#include "Tests.h"

#include "database/SqliteTools.h"
#include "database/SqliteTransaction.h"

class Sqlite : public Tests
{
};

TEST_F( Sqlite, TransactionRollback )
{
    auto t = ml->addTrack( "track", "album" );
    {
        auto trans = ml->getConn()->newTransaction();
        ASSERT_TRUE( sqlite::Transaction::isInProgress() );
        Track::setCoverPath( ml->getConn(), t, "/covers/1.jpg" );
        // Not committed
    }
    ASSERT_FALSE( sqlite::Transaction::isInProgress() );
    ASSERT_EQ( "", ml->trackCoverPath( t ) );

    {
        auto trans = ml->getConn()->newTransaction();
        Track::setCoverPath( ml->getConn(), t, "/covers/1.jpg" );
        trans->commit();
    }
    ASSERT_EQ( "/covers/1.jpg", ml->trackCoverPath( t ) );
}

TEST_F( Sqlite, NestedTransaction )
{
    auto t = ml->addTrack( "track", "album" );
    auto outer = ml->getConn()->newTransaction();
    {
        auto inner = ml->getConn()->newTransaction();
        Track::setCoverPath( ml->getConn(), t, "/covers/1.jpg" );
        inner->commit();
        // The inner commit is a no-op
        ASSERT_TRUE( sqlite::Transaction::isInProgress() );
    }
    outer->commit();
    ASSERT_FALSE( sqlite::Transaction::isInProgress() );
    ASSERT_EQ( "/covers/1.jpg", ml->trackCoverPath( t ) );
}

TEST_F( Sqlite, AffectedRows )
{
    ml->addTrack( "track 1", "album" );
    ml->addTrack( "track 2", "album" );
    ml->addTrack( "track 3", "other" );
    auto changed = sqlite::Tools::executeUpdate( ml->getConn(),
            "UPDATE Track SET title = 'x' WHERE album = ?", std::string{ "album" } );
    ASSERT_EQ( 2, changed );
    ASSERT_EQ( 0, Track::setCoverPath( ml->getConn(), 12345, "/nowhere.jpg" ) );
}

TEST_F( Sqlite, Errors )
{
    ASSERT_THROW( ml->execute( "NOT A REQUEST" ), sqlite::errors::Exception );
    ml->execute( "CREATE TABLE Unique_(v TEXT UNIQUE)" );
    ml->execute( "INSERT INTO Unique_ VALUES('a')" );
    ASSERT_THROW( ml->execute( "INSERT INTO Unique_ VALUES('a')" ),
                  sqlite::errors::ConstraintUnique );
}

TEST_F( Sqlite, ErrorMapping )
{
    try
    {
        sqlite::errors::mapToException( "INSERT", "boom", SQLITE_CONSTRAINT_NOTNULL );
    }
    catch ( const sqlite::errors::ConstraintUnique& )
    {
        FAIL();
    }
    catch ( const sqlite::errors::ConstraintViolation& ex )
    {
        ASSERT_EQ( SQLITE_CONSTRAINT, ex.code() );
        ASSERT_EQ( SQLITE_CONSTRAINT_NOTNULL, ex.extendedCode() );
    }
    ASSERT_THROW( sqlite::errors::mapToException( "INSERT", "boom",
                                                  SQLITE_CONSTRAINT_PRIMARYKEY ),
                  sqlite::errors::ConstraintUnique );
    try
    {
        sqlite::errors::mapToException( "SELECT", "busy", SQLITE_BUSY_SNAPSHOT );
    }
    catch ( const sqlite::errors::ConstraintViolation& )
    {
        FAIL();
    }
    catch ( const sqlite::errors::Exception& ex )
    {
        ASSERT_EQ( SQLITE_BUSY, ex.code() );
        ASSERT_NE( std::string::npos, std::string{ ex.what() }.find( "SELECT" ) );
    }

    ASSERT_TRUE( sqlite::errors::isTransient( SQLITE_BUSY ) );
    ASSERT_TRUE( sqlite::errors::isTransient( SQLITE_LOCKED_SHAREDCACHE ) );
    ASSERT_FALSE( sqlite::errors::isTransient( SQLITE_IOERR ) );
    ASSERT_FALSE( sqlite::errors::isTransient( SQLITE_CONSTRAINT_UNIQUE ) );
}

TEST_F( Sqlite, ColumnOutOfRange )
{
    ml->addTrack( "track", "album" );
    auto conn = ml->getConn();
    OPEN_READ_CONTEXT( ctx, conn );
    sqlite::Statement stmt( "SELECT title FROM Track" );
    stmt.execute();
    auto row = stmt.row();
    ASSERT_TRUE( row != nullptr );
    ASSERT_EQ( "track", row.load<std::string>( 0 ) );
    ASSERT_THROW( row.load<std::string>( 1 ), sqlite::errors::ColumnOutOfRange );
    while ( stmt.row() != nullptr )
        ;
}

TEST_F( Sqlite, BlobRoundTrip )
{
    std::vector<uint8_t> payload{ 0, 1, 2, 0, 255 };
    auto t = ml->addTrack( "track", "album", payload );
    auto track = ml->track( t );
    ASSERT_EQ( payload, track->inlineCover() );
    ASSERT_EQ( "album", track->album() );
    ASSERT_EQ( 0, track->albumId() );
}

TEST_F( Sqlite, CommitFailureRollsBack )
{
    auto t = ml->addTrack( "track", "album" );
    ml->execute( "CREATE TABLE Guard(track_id INTEGER REFERENCES Track(id_track) "
                 "DEFERRABLE INITIALLY DEFERRED)" );
    {
        auto trans = ml->getConn()->newTransaction();
        Track::setCoverPath( ml->getConn(), t, "/covers/1.jpg" );
        ml->execute( "INSERT INTO Guard VALUES(-1)" );
        ASSERT_THROW( trans->commit(), sqlite::errors::ConstraintForeignKey );
    }
    ASSERT_FALSE( sqlite::Transaction::isInProgress() );
    ASSERT_EQ( "", ml->trackCoverPath( t ) );
    // The connection is still usable
    ml->addTrack( "other", "album" );
    ASSERT_EQ( 2u, ml->tracks().size() );
}
