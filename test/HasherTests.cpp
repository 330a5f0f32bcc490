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

#include "gtest/gtest.h"

#include "common/util.h"
#include "coverlibrary/filesystem/Errors.h"
#include "covers/SizeBucket.h"
#include "utils/Directory.h"
#include "utils/File.h"
#include "utils/Sha256Hasher.h"

#include <cstring>

using namespace coverlibrary;
using utils::hash::Sha256Hasher;

TEST( Sha256, KnownDigests )
{
    ASSERT_EQ( "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
               Sha256Hasher::fromBuff( nullptr, 0 ) );
    const char* abc = "abc";
    ASSERT_EQ( "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
               Sha256Hasher::fromBuff( reinterpret_cast<const uint8_t*>( abc ),
                                       strlen( abc ) ) );
}

TEST( Sha256, Incremental )
{
    auto payload = makeJpeg( 1000 );
    Sha256Hasher h;
    h.update( payload.data(), 10 );
    h.update( payload.data() + 10, payload.size() - 10 );
    ASSERT_EQ( Sha256Hasher::fromBuff( payload.data(), payload.size() ),
               h.finalize() );
    ASSERT_THROW( h.finalize(), std::logic_error );
}

class Sha256File : public testing::Test
{
protected:
    std::string dir;

    virtual void SetUp() override
    {
        auto tmpl = getTempDir() + "coverlib_hash_XXXXXX";
        ASSERT_NE( nullptr, mkdtemp( &tmpl[0] ) );
        dir = tmpl + '/';
    }

    virtual void TearDown() override
    {
        utils::fs::rmdir( dir );
    }
};

TEST_F( Sha256File, MatchesBufferDigest )
{
    // Spans multiple read chunks
    auto payload = makeJpeg( Sha256Hasher::ChunkSize * 2 + 123 );
    utils::fs::writeFile( dir + "a.jpg", payload );
    auto digest = Sha256Hasher::fromFile( dir + "a.jpg" );
    ASSERT_EQ( 64u, digest.size() );
    ASSERT_EQ( std::string::npos, digest.find_first_not_of( "0123456789abcdef" ) );
    ASSERT_EQ( Sha256Hasher::fromBuff( payload.data(), payload.size() ), digest );
}

TEST_F( Sha256File, OnlyDependsOnContent )
{
    auto payload = makeJpeg( 5000 );
    utils::fs::writeFile( dir + "a.jpg", payload );
    utils::fs::writeFile( dir + "other_name.png", payload );
    ASSERT_EQ( Sha256Hasher::fromFile( dir + "a.jpg" ),
               Sha256Hasher::fromFile( dir + "other_name.png" ) );

    payload[4999] ^= 0x01;
    utils::fs::writeFile( dir + "b.jpg", payload );
    ASSERT_NE( Sha256Hasher::fromFile( dir + "a.jpg" ),
               Sha256Hasher::fromFile( dir + "b.jpg" ) );
}

TEST_F( Sha256File, MissingFile )
{
    try
    {
        Sha256Hasher::fromFile( dir + "missing.jpg" );
        FAIL();
    }
    catch ( const fs::errors::System& ex )
    {
        ASSERT_TRUE( ex.isNotFound() );
    }
}

TEST( SizeBuckets, Key )
{
    ASSERT_EQ( 0u, SizeBuckets::keyFor( 0 ) );
    ASSERT_EQ( 0u, SizeBuckets::keyFor( 1023 ) );
    ASSERT_EQ( 1u, SizeBuckets::keyFor( 1024 ) );
    ASSERT_EQ( 1u, SizeBuckets::keyFor( 2047 ) );
    ASSERT_EQ( 2u, SizeBuckets::keyFor( 2048 ) );
}

TEST( SizeBuckets, OnlyMultipleEntriesAreCandidates )
{
    SizeBuckets b;
    b.add( "a", 1500 );
    b.add( "b", 1100 );
    b.add( "c", 5000 );
    b.add( "d", 300 );
    ASSERT_EQ( 3u, b.nbBuckets() );
    ASSERT_EQ( 4u, b.nbFiles() );

    auto candidates = b.hashCandidates();
    ASSERT_EQ( 1u, candidates.size() );
    ASSERT_EQ( 2u, candidates[0].size() );
    ASSERT_EQ( "a", candidates[0][0].path );
    ASSERT_EQ( 1500u, candidates[0][0].size );
    ASSERT_EQ( "b", candidates[0][1].path );
}

TEST( SizeBuckets, Empty )
{
    SizeBuckets b;
    ASSERT_TRUE( b.hashCandidates().empty() );
    b.add( "a", 10 );
    ASSERT_TRUE( b.hashCandidates().empty() );
}
