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
#include "SqliteErrors.h"

namespace coverlibrary
{
namespace sqlite
{
namespace errors
{

Exception::Exception( const char* req, const char* errMsg, int extendedCode )
    : std::runtime_error( std::string{ "Failed to run [" } +
                          ( req != nullptr ? req : "<unknown request>" ) +
                          "]: " + ( errMsg != nullptr ? errMsg : "" ) +
                          " (" + std::to_string( extendedCode ) + ")" )
    , m_extendedCode( extendedCode )
{
}

Exception::Exception( const std::string& msg, int extendedCode )
    : std::runtime_error( msg )
    , m_extendedCode( extendedCode )
{
}

int Exception::code() const
{
    return m_extendedCode & 0xFF;
}

int Exception::extendedCode() const
{
    return m_extendedCode;
}

ConstraintViolation::ConstraintViolation( const char* req, const char* errMsg,
                                          int extendedCode )
    : Exception( std::string{ "Constraint violation in [" } +
                 ( req != nullptr ? req : "<unknown request>" ) + "]: " +
                 ( errMsg != nullptr ? errMsg : "" ), extendedCode )
{
}

ColumnOutOfRange::ColumnOutOfRange( unsigned int idx, unsigned int nbColumns )
    : Exception( "Column " + std::to_string( idx ) + " requested from a row of " +
                 std::to_string( nbColumns ) + " column(s)", SQLITE_RANGE )
{
}

bool isTransient( int errCode )
{
    switch ( errCode & 0xFF )
    {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
        return true;
    }
    return false;
}

void mapToException( const char* reqStr, const char* errMsg, int extRes )
{
    if ( ( extRes & 0xFF ) != SQLITE_CONSTRAINT )
        throw Exception( reqStr, errMsg, extRes );
    switch ( extRes )
    {
    case SQLITE_CONSTRAINT_FOREIGNKEY:
        throw ConstraintForeignKey( reqStr, errMsg, extRes );
    case SQLITE_CONSTRAINT_PRIMARYKEY:
    case SQLITE_CONSTRAINT_UNIQUE:
        throw ConstraintUnique( reqStr, errMsg, extRes );
    default:
        throw ConstraintViolation( reqStr, errMsg, extRes );
    }
}

}
}
}
