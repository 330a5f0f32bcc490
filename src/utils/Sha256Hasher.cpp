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

#include "Sha256Hasher.h"

#include "coverlibrary/filesystem/Errors.h"

#include <openssl/evp.h>

#include <cerrno>
#include <cstdio>
#include <new>
#include <stdexcept>
#include <vector>

namespace coverlibrary
{
namespace utils
{
namespace hash
{

constexpr size_t Sha256Hasher::ChunkSize;

Sha256Hasher::Sha256Hasher()
    : m_ctx( EVP_MD_CTX_new(), &EVP_MD_CTX_free )
    , m_finalized( false )
{
    if ( m_ctx == nullptr )
        throw std::bad_alloc{};
    if ( EVP_DigestInit_ex( m_ctx.get(), EVP_sha256(), nullptr ) != 1 )
        throw std::runtime_error{ "Failed to initialize SHA-256 context" };
}

void Sha256Hasher::update( const uint8_t* buff, size_t size )
{
    if ( m_finalized == true )
        throw std::logic_error{ "Can't update a finalized hasher" };
    if ( size == 0 )
        return;
    if ( EVP_DigestUpdate( m_ctx.get(), buff, size ) != 1 )
        throw std::runtime_error{ "Failed to update SHA-256 digest" };
}

std::string Sha256Hasher::finalize()
{
    if ( m_finalized == true )
        throw std::logic_error{ "Hasher was already finalized" };
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if ( EVP_DigestFinal_ex( m_ctx.get(), digest, &length ) != 1 )
        throw std::runtime_error{ "Failed to finalize SHA-256 digest" };
    m_finalized = true;

    static const char hex[] = "0123456789abcdef";
    std::string res;
    res.reserve( length * 2 );
    for ( auto i = 0u; i < length; ++i )
    {
        res += hex[digest[i] >> 4];
        res += hex[digest[i] & 0x0F];
    }
    return res;
}

std::string Sha256Hasher::fromFile( const std::string& path )
{
    std::unique_ptr<FILE, decltype(&fclose)> file{
        fopen( path.c_str(), "rb" ), &fclose
    };
    if ( file == nullptr )
        throw fs::errors::System{ errno, "Failed to open " + path };
    Sha256Hasher hasher;
    std::vector<uint8_t> buff( ChunkSize );
    while ( feof( file.get() ) == false )
    {
        auto read = fread( buff.data(), 1, buff.size(), file.get() );
        if ( ferror( file.get() ) )
            throw fs::errors::System{ errno != 0 ? errno : EIO,
                                          "Failed to read " + path };
        hasher.update( buff.data(), read );
    }
    return hasher.finalize();
}

std::string Sha256Hasher::fromBuff( const uint8_t* buff, size_t size )
{
    Sha256Hasher hasher;
    hasher.update( buff, size );
    return hasher.finalize();
}

}
}
}
