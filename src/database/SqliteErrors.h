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

#include <string>
#include <stdexcept>

#include <sqlite3.h>

namespace coverlibrary
{

namespace sqlite
{
namespace errors
{

/**
 * Base type for every store failure. Engines catch this one to fold per-row
 * failures into their result record.
 */
class Exception : public std::runtime_error
{
public:
    Exception( const char* req, const char* errMsg, int extendedCode );
    Exception( const std::string& msg, int extendedCode );

    /// The primary result code (SQLITE_BUSY, SQLITE_CONSTRAINT, ...)
    int code() const;
    /// The extended result code, as enabled on every connection
    int extendedCode() const;

private:
    int m_extendedCode;
};

class ConstraintViolation : public Exception
{
public:
    ConstraintViolation( const char* req, const char* errMsg, int extendedCode );
};

class ConstraintForeignKey : public ConstraintViolation
{
public:
    using ConstraintViolation::ConstraintViolation;
};

/// Also used for primary key collisions
class ConstraintUnique : public ConstraintViolation
{
public:
    using ConstraintViolation::ConstraintViolation;
};

class ColumnOutOfRange : public Exception
{
public:
    ColumnOutOfRange( unsigned int idx, unsigned int nbColumns );
};

/**
 * @brief isTransient Returns true when another connection holding the
 *        database is the cause, in which case the step can be retried
 */
bool isTransient( int errCode );

[[noreturn]] void mapToException( const char* reqStr, const char* errMsg, int extRes );

} // namespace errors
} // namespace sqlite

} // namespace coverlibrary
