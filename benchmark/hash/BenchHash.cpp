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

#include <benchmark/benchmark.h>
#include <cstdlib>
#include <string>
#include <vector>
#include <unistd.h>

#include "utils/File.h"
#include "utils/Sha256Hasher.h"

using coverlibrary::utils::hash::Sha256Hasher;

static std::vector<uint8_t> makeInput( size_t size )
{
    std::vector<uint8_t> input( size );
    for ( auto i = 0u; i < size; ++i )
        input[i] = static_cast<uint8_t>( i * 31 );
    return input;
}

static void BenchBuffer( benchmark::State& state )
{
    auto input = makeInput( state.range( 0 ) );

    while ( state.KeepRunning() )
    {
        auto res = Sha256Hasher::fromBuff( input.data(), input.size() );
        benchmark::DoNotOptimize( res );
    }
    state.SetBytesProcessed( state.iterations() * input.size() );
}

static void BenchFile( benchmark::State& state )
{
    std::string path = "/tmp/coverlib_bench_XXXXXX";
    auto fd = mkstemp( &path[0] );
    if ( fd < 0 )
    {
        state.SkipWithError( "Failed to create a temporary file" );
        return;
    }
    close( fd );
    auto input = makeInput( state.range( 0 ) );
    coverlibrary::utils::fs::writeFile( path, input );

    while ( state.KeepRunning() )
    {
        auto res = Sha256Hasher::fromFile( path );
        benchmark::DoNotOptimize( res );
    }
    state.SetBytesProcessed( state.iterations() * input.size() );
    unlink( path.c_str() );
}

BENCHMARK(BenchBuffer)->RangeMultiplier( 4 )->Range( 1024, 4 * 1024 * 1024 );
BENCHMARK(BenchFile)->RangeMultiplier( 4 )->Range( 1024, 4 * 1024 * 1024 );

BENCHMARK_MAIN();
