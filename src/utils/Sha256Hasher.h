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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace coverlibrary
{
namespace utils
{
namespace hash
{

/**
 * @brief The Sha256Hasher class computes SHA-256 digests
 *
 * The digest is returned as 64 lowercase hexadecimal characters, and only
 * depends on the hashed content.
 */
class Sha256Hasher
{
public:
    static constexpr size_t ChunkSize = 64 * 1024;

    Sha256Hasher();

    void update( const uint8_t* buff, size_t size );
    /**
     * @brief finalize Returns the digest of all the data provided to update()
     *
     * The hasher can't be updated after this has been called.
     */
    std::string finalize();

    /**
     * @brief fromFile Hashes a file content, reading it in ChunkSize chunks
     * @throw fs::errors::System if the file can't be opened or read
     */
    static std::string fromFile( const std::string& path );
    static std::string fromBuff( const uint8_t* buff, size_t size );

private:
    std::unique_ptr<EVP_MD_CTX, void(*)(EVP_MD_CTX*)> m_ctx;
    bool m_finalized;
};

}
}
}
