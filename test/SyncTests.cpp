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

#include "common/util.h"
#include "utils/Directory.h"

#include <sys/stat.h>
#include <unistd.h>

class Sync : public Tests
{
};

TEST_F( Sync, PointsRowsToFiles )
{
    auto t1 = ml->addTrack( "track 1", "album" );
    auto t2 = ml->addTrack( "track 2", "album" );
    auto a = ml->addAlbum( "album" );
    auto f1 = writeFile( trackCoverFile( std::to_string( t1 ) + ".jpg" ), makeJpeg( 100 ) );
    auto f2 = writeFile( trackCoverFile( std::to_string( t2 ) + ".PNG" ), makePng( 100 ) );
    auto fa = writeFile( albumArtFile( std::to_string( a ) + ".webp" ), makeJpeg( 10 ) );

    auto res = ml->syncPathsFromFiles( coversRoot );
    ASSERT_EQ( 2u, res.tracksMigrated );
    ASSERT_EQ( 1u, res.albumsMigrated );
    ASSERT_EQ( 3u, res.total );
    ASSERT_EQ( 3u, res.processed );
    ASSERT_TRUE( res.errors.empty() );

    ASSERT_EQ( f1, ml->trackCoverPath( t1 ) );
    ASSERT_EQ( f2, ml->trackCoverPath( t2 ) );
    ASSERT_EQ( fa, ml->albumArtPath( a ) );
}

TEST_F( Sync, IgnoresUnmatchedIds )
{
    auto t = ml->addTrack( "track", "album" );
    writeFile( trackCoverFile( std::to_string( t ) + ".jpg" ), makeJpeg( 100 ) );
    writeFile( trackCoverFile( "99999.jpg" ), makeJpeg( 100 ) );
    writeFile( albumArtFile( "99999.jpg" ), makeJpeg( 100 ) );

    auto res = ml->syncPathsFromFiles( coversRoot );
    ASSERT_EQ( 1u, res.tracksMigrated );
    ASSERT_EQ( 0u, res.albumsMigrated );
    ASSERT_EQ( 1u, res.total );
    ASSERT_EQ( 1u, res.processed );
    ASSERT_TRUE( res.errors.empty() );
    ASSERT_EQ( 1u, ml->tracks().size() );
    ASSERT_EQ( 0u, ml->albums().size() );
}

TEST_F( Sync, IgnoresNonCoverFiles )
{
    auto t = ml->addTrack( "track", "album" );
    auto id = std::to_string( t );
    writeFile( trackCoverFile( id + ".txt" ), { 1 } );
    writeFile( trackCoverFile( id + ".gif" ), { 1 } );
    writeFile( trackCoverFile( "cover.jpg" ), makeJpeg( 10 ) );
    writeFile( trackCoverFile( id + "abc.jpg" ), makeJpeg( 10 ) );
    writeFile( trackCoverFile( id ), makeJpeg( 10 ) );
    ASSERT_TRUE( utils::fs::mkdir( trackCoverFile( id + ".jpg" ) ) );

    auto res = ml->syncPathsFromFiles( coversRoot );
    ASSERT_EQ( 0u, res.total );
    ASSERT_TRUE( res.errors.empty() );
    ASSERT_EQ( "", ml->trackCoverPath( t ) );
}

TEST_F( Sync, MissingFolders )
{
    auto res = ml->syncPathsFromFiles( testDir + "nowhere" );
    ASSERT_EQ( 0u, res.total );
    ASSERT_TRUE( res.errors.empty() );
}

TEST_F( Sync, UnreadableFolder )
{
    if ( geteuid() == 0 )
        return; // root ignores permissions
    auto t = ml->addTrack( "track", "album" );
    writeFile( trackCoverFile( std::to_string( t ) + ".jpg" ), makeJpeg( 100 ) );
    ASSERT_EQ( 0, chmod( ( coversRoot + "tracks" ).c_str(), 0 ) );
    auto res = ml->syncPathsFromFiles( coversRoot );
    chmod( ( coversRoot + "tracks" ).c_str(), 0700 );
    ASSERT_EQ( 0u, res.total );
    ASSERT_EQ( 1u, res.errors.size() );
}

TEST_F( Sync, OverridesExistingPath )
{
    auto t = ml->addTrack( "track", "album", {}, "/old/path.jpg" );
    auto f = writeFile( trackCoverFile( std::to_string( t ) + ".jpeg" ), makeJpeg( 100 ) );
    auto res = ml->syncPathsFromFiles( coversRoot );
    ASSERT_EQ( 1u, res.tracksMigrated );
    ASSERT_EQ( f, ml->trackCoverPath( t ) );
}

TEST_F( Sync, RowFailure )
{
    auto t1 = ml->addTrack( "track 1", "album" );
    auto t2 = ml->addTrack( "track 2", "album" );
    auto f1 = writeFile( trackCoverFile( std::to_string( t1 ) + ".jpg" ), makeJpeg( 100 ) );
    writeFile( trackCoverFile( std::to_string( t2 ) + ".jpg" ), makeJpeg( 100 ) );
    ml->execute( "CREATE TRIGGER fail_update BEFORE UPDATE OF cover_path ON Track "
                 "WHEN NEW.id_track = " + std::to_string( t2 ) +
                 " BEGIN SELECT RAISE(ABORT, 'nope'); END" );

    auto res = ml->syncPathsFromFiles( coversRoot );
    ASSERT_EQ( 1u, res.tracksMigrated );
    ASSERT_EQ( 1u, res.total );
    ASSERT_EQ( 1u, res.errors.size() );
    ASSERT_NE( std::string::npos, res.errors[0].find( std::to_string( t2 ) ) );
    // The rest of the batch was committed
    ASSERT_EQ( f1, ml->trackCoverPath( t1 ) );
    ASSERT_EQ( "", ml->trackCoverPath( t2 ) );
}

TEST_F( Sync, CommitFailure )
{
    auto t = ml->addTrack( "track", "album" );
    writeFile( trackCoverFile( std::to_string( t ) + ".jpg" ), makeJpeg( 100 ) );
    // A deferred foreign key violation is only reported when committing
    ml->execute( "CREATE TABLE Guard(track_id INTEGER REFERENCES Track(id_track) "
                 "DEFERRABLE INITIALLY DEFERRED)" );
    ml->execute( "CREATE TRIGGER break_commit AFTER UPDATE OF cover_path ON Track "
                 "BEGIN INSERT INTO Guard VALUES(-1); END" );

    auto res = ml->syncPathsFromFiles( coversRoot );
    ASSERT_EQ( 0u, res.tracksMigrated );
    ASSERT_EQ( 0u, res.total );
    ASSERT_EQ( 1u, res.errors.size() );
    ASSERT_EQ( "", ml->trackCoverPath( t ) );
}
