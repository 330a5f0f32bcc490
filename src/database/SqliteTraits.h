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

#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "SqliteErrors.h"

namespace coverlibrary
{

namespace sqlite
{

/**
 * Binds as NULL when the value is 0
 */
struct ForeignKey
{
    constexpr explicit ForeignKey(int64_t v) : value(v) {}
    int64_t value;
};

/**
 * Binds as NULL when the provided string is empty. This is how absent paths
 * are stored.
 */
struct NullableString
{
    explicit NullableString( std::string str ) : s( std::move( str ) ) {}
    std::string s;
};

using Blob = std::vector<uint8_t>;

template <typename ToCheck, typename T>
using IsSameDecay = std::is_same<typename std::decay<ToCheck>::type, T>;

template <typename T, typename Enable = void>
struct Traits;

template <typename T>
struct Traits<T, typename std::enable_if<
        std::is_integral<typename std::decay<T>::type>::value
        && ! IsSameDecay<T, int64_t>::value
        && ! IsSameDecay<T, uint64_t>::value
    >::type>
{
    static constexpr
    int (*Bind)(sqlite3_stmt *, int, int) = &sqlite3_bind_int;

    static constexpr
    int (*Load)(sqlite3_stmt *, int) = &sqlite3_column_int;
};

template <typename T>
struct Traits<T, typename std::enable_if<IsSameDecay<T, int64_t>::value ||
                                         IsSameDecay<T, uint64_t>::value>::type>
{
    static int Bind( sqlite3_stmt* stmt, int pos, sqlite3_int64 value )
    {
        return sqlite3_bind_int64( stmt, pos, value );
    }

    static typename std::decay<T>::type Load( sqlite3_stmt* stmt, int pos )
    {
        return static_cast<typename std::decay<T>::type>(
                    sqlite3_column_int64( stmt, pos ) );
    }
};

template <typename T>
struct Traits<T, typename std::enable_if<IsSameDecay<T, std::string>::value ||
                                         IsSameDecay<T, const char*>::value ||
                                         IsSameDecay<T, char*>::value>::type>
{
    static int Bind(sqlite3_stmt* stmt, int pos, const std::string& value )
    {
        return sqlite3_bind_text( stmt, pos, value.c_str(), -1, SQLITE_TRANSIENT );
    }

    static std::string Load( sqlite3_stmt* stmt, int pos )
    {
        auto tmp = reinterpret_cast<const char*>( sqlite3_column_text( stmt, pos ) );
        if ( tmp != nullptr )
            return std::string( tmp );
        return std::string();
    }
};

template <typename T>
struct Traits<T, typename std::enable_if<IsSameDecay<T, ForeignKey>::value>::type>
{
    static int Bind( sqlite3_stmt *stmt, int pos, ForeignKey fk )
    {
        if ( fk.value != 0 )
            return sqlite3_bind_int64( stmt, pos, fk.value );
        return sqlite3_bind_null( stmt, pos );
    }
};

template <typename T>
struct Traits<T, typename std::enable_if<IsSameDecay<T, NullableString>::value>::type>
{
    static int Bind( sqlite3_stmt *stmt, int pos, const NullableString& ns )
    {
        if ( ns.s.empty() == false )
            return Traits<std::string>::Bind( stmt, pos, ns.s );
        return sqlite3_bind_null( stmt, pos );
    }
};

template <typename T>
struct Traits<T, typename std::enable_if<IsSameDecay<T, Blob>::value>::type>
{
    static int Bind( sqlite3_stmt* stmt, int pos, const Blob& value )
    {
        if ( value.empty() == true )
            return sqlite3_bind_null( stmt, pos );
        return sqlite3_bind_blob64( stmt, pos, value.data(), value.size(),
                                    SQLITE_TRANSIENT );
    }

    static Blob Load( sqlite3_stmt* stmt, int pos )
    {
        // sqlite3_column_bytes must be called after sqlite3_column_blob
        auto data = static_cast<const uint8_t*>( sqlite3_column_blob( stmt, pos ) );
        auto size = sqlite3_column_bytes( stmt, pos );
        if ( data == nullptr || size <= 0 )
            return Blob{};
        return Blob( data, data + size );
    }
};

template <>
struct Traits<std::nullptr_t>
{
    static int Bind(sqlite3_stmt* stmt, int idx, std::nullptr_t)
    {
        return sqlite3_bind_null( stmt, idx );
    }
};

template <typename T>
struct Traits<T, typename std::enable_if<std::is_enum<
        typename std::decay<T>::type
    >::value>::type>
{
    using type_t = typename std::underlying_type<typename std::decay<T>::type>::type;
    static int Bind(sqlite3_stmt* stmt, int pos, T value )
    {
        return sqlite3_bind_int( stmt, pos, static_cast<type_t>( value ) );
    }

    static T Load( sqlite3_stmt* stmt, int pos )
    {
        return static_cast<T>( sqlite3_column_int( stmt, pos ) );
    }
};

} // namespace sqlite

}
