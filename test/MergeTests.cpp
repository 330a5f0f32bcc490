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
#include "covers/DuplicateMerger.h"
#include "utils/File.h"

class Merge : public Tests
{
};

TEST_F( Merge, Scenario )
{
    auto content = makeJpeg( 500001 );
    auto f1 = writeFile( trackCoverFile( "1.jpg" ), content );
    auto f2 = writeFile( trackCoverFile( "2.jpg" ), content );
    auto f3 = writeFile( trackCoverFile( "3.jpg" ), makeJpeg( 500050, 1 ) );
    auto t1 = ml->addTrack( "track 1", "X", {}, f1 );
    auto t2 = ml->addTrack( "track 2", "X", {}, f2 );
    auto t3 = ml->addTrack( "track 3", "X", {}, f3 );

    auto res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 1u, res.coversMerged );
    ASSERT_EQ( 500001u, res.spaceSavedBytes );
    ASSERT_EQ( 1u, res.albumsProcessed );
    ASSERT_TRUE( res.errors.empty() );

    ASSERT_EQ( f1, ml->trackCoverPath( t1 ) );
    ASSERT_EQ( f1, ml->trackCoverPath( t2 ) );
    ASSERT_EQ( f3, ml->trackCoverPath( t3 ) );
    ASSERT_TRUE( fileExists( f1 ) );
    ASSERT_FALSE( fileExists( f2 ) );
    ASSERT_TRUE( fileExists( f3 ) );

    // Nothing left to do
    res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 0u, res.coversMerged );
    ASSERT_EQ( 0u, res.spaceSavedBytes );
    ASSERT_EQ( 1u, res.albumsProcessed );
    ASSERT_TRUE( res.errors.empty() );
}

TEST_F( Merge, KeepsSmallestPath )
{
    auto content = makeJpeg( 3000 );
    auto fb = writeFile( trackCoverFile( "b.jpg" ), content );
    auto fa = writeFile( trackCoverFile( "a.jpg" ), content );
    auto fc = writeFile( trackCoverFile( "c.jpg" ), content );
    auto t1 = ml->addTrack( "track 1", "album", {}, fb );
    auto t2 = ml->addTrack( "track 2", "album", {}, fc );
    auto t3 = ml->addTrack( "track 3", "album", {}, fa );
    auto t4 = ml->addTrack( "track 4", "album", {}, fc );

    auto res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 2u, res.coversMerged );
    ASSERT_EQ( 6000u, res.spaceSavedBytes );
    for ( auto id : { t1, t2, t3, t4 } )
        ASSERT_EQ( fa, ml->trackCoverPath( id ) );
    ASSERT_TRUE( fileExists( fa ) );
    ASSERT_FALSE( fileExists( fb ) );
    ASSERT_FALSE( fileExists( fc ) );
}

TEST_F( Merge, SeparateAlbums )
{
    auto content = makeJpeg( 2000 );
    auto f1 = writeFile( trackCoverFile( "1.jpg" ), content );
    auto f2 = writeFile( trackCoverFile( "2.jpg" ), content );
    auto t1 = ml->addTrack( "track 1", "album A", {}, f1 );
    auto t2 = ml->addTrack( "track 2", "album B", {}, f2 );
    // Tracks without an album are never considered
    auto f3 = writeFile( trackCoverFile( "3.jpg" ), content );
    ml->addTrack( "track 3", "", {}, f3 );

    auto res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 0u, res.coversMerged );
    ASSERT_EQ( 2u, res.albumsProcessed );
    ASSERT_EQ( f1, ml->trackCoverPath( t1 ) );
    ASSERT_EQ( f2, ml->trackCoverPath( t2 ) );
    ASSERT_TRUE( fileExists( f3 ) );
}

TEST_F( Merge, SharedPathIsNotADuplicate )
{
    auto f = writeFile( trackCoverFile( "1.jpg" ), makeJpeg( 100 ) );
    ml->addTrack( "track 1", "album", {}, f );
    ml->addTrack( "track 2", "album", {}, f );

    auto res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 0u, res.coversMerged );
    ASSERT_EQ( 1u, res.albumsProcessed );
    ASSERT_TRUE( res.errors.empty() );
    ASSERT_TRUE( fileExists( f ) );
}

TEST_F( Merge, InlineCoverKept )
{
    auto content = makeJpeg( 2500 );
    auto f1 = writeFile( trackCoverFile( "1.jpg" ), content );
    auto f2 = writeFile( trackCoverFile( "2.jpg" ), content );
    // Both state: not cleared yet after a migration
    auto t1 = ml->addTrack( "track 1", "album", content, f1 );
    auto t2 = ml->addTrack( "track 2", "album", {}, f2 );
    // Inline only: nothing to merge
    auto t3 = ml->addTrack( "track 3", "album", content );

    auto candidates = Track::fetchCoverPathsByAlbum( ml->getConn(), "album" );
    ASSERT_EQ( 2u, candidates.size() );
    ASSERT_EQ( t1, candidates[0].first );
    ASSERT_EQ( t2, candidates[1].first );

    auto res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 1u, res.coversMerged );
    ASSERT_TRUE( res.errors.empty() );
    ASSERT_EQ( f1, ml->trackCoverPath( t2 ) );
    ASSERT_EQ( "", ml->trackCoverPath( t3 ) );
    ASSERT_EQ( CoverState::Both, ml->track( t1 )->coverState() );
    ASSERT_EQ( CoverState::InlineOnly, ml->track( t3 )->coverState() );
    ASSERT_FALSE( fileExists( f2 ) );
}

TEST_F( Merge, DifferentContentSameBucket )
{
    auto f1 = writeFile( trackCoverFile( "1.jpg" ), makeJpeg( 1500, 1 ) );
    auto f2 = writeFile( trackCoverFile( "2.jpg" ), makeJpeg( 1500, 2 ) );
    ml->addTrack( "track 1", "album", {}, f1 );
    ml->addTrack( "track 2", "album", {}, f2 );

    auto res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 0u, res.coversMerged );
    ASSERT_TRUE( fileExists( f1 ) );
    ASSERT_TRUE( fileExists( f2 ) );
}

TEST_F( Merge, MissingFile )
{
    auto content = makeJpeg( 100 );
    auto f1 = writeFile( trackCoverFile( "1.jpg" ), content );
    auto f2 = writeFile( trackCoverFile( "2.jpg" ), content );
    auto missing = trackCoverFile( "3.jpg" );
    ml->addTrack( "track 1", "album", {}, f1 );
    auto t2 = ml->addTrack( "track 2", "album", {}, f2 );
    auto t3 = ml->addTrack( "track 3", "album", {}, missing );

    auto res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 1u, res.coversMerged );
    ASSERT_EQ( 1u, res.errors.size() );
    ASSERT_NE( std::string::npos, res.errors[0].find( missing ) );
    ASSERT_EQ( f1, ml->trackCoverPath( t2 ) );
    ASSERT_EQ( missing, ml->trackCoverPath( t3 ) );
}

TEST_F( Merge, OutOfBandDeletion )
{
    auto content = makeJpeg( 4000 );
    auto f1 = writeFile( trackCoverFile( "1.jpg" ), content );
    auto f2 = writeFile( trackCoverFile( "2.jpg" ), content );
    ml->addTrack( "track 1", "album", {}, f1 );
    auto t2 = ml->addTrack( "track 2", "album", {}, f2 );
    storage->removedOutOfBand.insert( f2 );

    auto res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 1u, storage->nbDeleteCalls );
    ASSERT_TRUE( res.errors.empty() );
    ASSERT_EQ( 0u, res.coversMerged );
    ASSERT_EQ( 0u, res.spaceSavedBytes );
    ASSERT_EQ( f1, ml->trackCoverPath( t2 ) );
    ASSERT_FALSE( fileExists( f2 ) );

    res = ml->mergeDuplicateCovers();
    ASSERT_TRUE( res.errors.empty() );
    ASSERT_EQ( 0u, res.spaceSavedBytes );
}

TEST_F( Merge, DeleteFailure )
{
    auto content = makeJpeg( 4000 );
    auto f1 = writeFile( trackCoverFile( "1.jpg" ), content );
    auto f2 = writeFile( trackCoverFile( "2.jpg" ), content );
    ml->addTrack( "track 1", "album", {}, f1 );
    auto t2 = ml->addTrack( "track 2", "album", {}, f2 );
    storage->failingDeletes.insert( f2 );

    auto res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 0u, res.coversMerged );
    ASSERT_EQ( 0u, res.spaceSavedBytes );
    ASSERT_EQ( 1u, res.errors.size() );
    // The database still got updated, the file is now an orphan
    ASSERT_EQ( f1, ml->trackCoverPath( t2 ) );
    ASSERT_TRUE( fileExists( f2 ) );
}

TEST_F( Merge, RowFailure )
{
    auto content = makeJpeg( 4000 );
    auto f1 = writeFile( trackCoverFile( "1.jpg" ), content );
    auto f2 = writeFile( trackCoverFile( "2.jpg" ), content );
    ml->addTrack( "track 1", "album", {}, f1 );
    auto t2 = ml->addTrack( "track 2", "album", {}, f2 );
    ml->execute( "CREATE TRIGGER fail_update BEFORE UPDATE OF cover_path ON Track "
                 "WHEN NEW.id_track = " + std::to_string( t2 ) +
                 " BEGIN SELECT RAISE(ABORT, 'nope'); END" );

    auto res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 1u, res.errors.size() );
    ASSERT_NE( std::string::npos, res.errors[0].find( std::to_string( t2 ) ) );
    ASSERT_EQ( f2, ml->trackCoverPath( t2 ) );
    // Still referenced, so it must survive
    ASSERT_TRUE( fileExists( f2 ) );
    ASSERT_EQ( 0u, res.coversMerged );
}

TEST_F( Merge, CommitFailure )
{
    auto content = makeJpeg( 4000 );
    auto f1 = writeFile( trackCoverFile( "1.jpg" ), content );
    auto f2 = writeFile( trackCoverFile( "2.jpg" ), content );
    ml->addTrack( "track 1", "album", {}, f1 );
    auto t2 = ml->addTrack( "track 2", "album", {}, f2 );
    ml->execute( "CREATE TABLE Guard(track_id INTEGER REFERENCES Track(id_track) "
                 "DEFERRABLE INITIALLY DEFERRED)" );
    ml->execute( "CREATE TRIGGER break_commit AFTER UPDATE OF cover_path ON Track "
                 "BEGIN INSERT INTO Guard VALUES(-1); END" );

    auto res = ml->mergeDuplicateCovers();
    ASSERT_EQ( 1u, res.errors.size() );
    ASSERT_EQ( 0u, res.coversMerged );
    ASSERT_EQ( 0u, storage->nbDeleteCalls );
    ASSERT_EQ( f2, ml->trackCoverPath( t2 ) );
    ASSERT_TRUE( fileExists( f2 ) );
}

TEST_F( Merge, FindDuplicatesSkipsUnhashable )
{
    auto content = makeJpeg( 100 );
    std::vector<CoverFile> files{
        { writeFile( trackCoverFile( "1.jpg" ), content ), 100 },
        { trackCoverFile( "missing.jpg" ), 100 },
        { writeFile( trackCoverFile( "2.jpg" ), content ), 100 },
        // Alone in its bucket, never hashed even though the file is missing
        { trackCoverFile( "big.jpg" ), 10000 },
    };
    std::vector<std::string> errors;
    auto groups = DuplicateMerger::findDuplicates( files, errors );
    ASSERT_EQ( 1u, errors.size() );
    ASSERT_EQ( 1u, groups.size() );
    ASSERT_EQ( 2u, groups[0].size() );
    ASSERT_EQ( trackCoverFile( "1.jpg" ), groups[0][0].path );
    ASSERT_EQ( trackCoverFile( "2.jpg" ), groups[0][1].path );
}
