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

#include <cstdint>

namespace coverlibrary
{

/**
 * @brief The CoverState enum describes which representations of a cover an
 *        entity currently has.
 *
 * An empty payload or an empty path is considered absent.
 */
enum class CoverState : uint8_t
{
    InlineOnly,
    PathOnly,
    Both,
    Neither,
};

inline CoverState coverState( bool hasInline, bool hasPath )
{
    if ( hasInline == true )
        return hasPath == true ? CoverState::Both : CoverState::InlineOnly;
    return hasPath == true ? CoverState::PathOnly : CoverState::Neither;
}

/* Needs its inline payload to be written to a file */
inline bool isMigrationCandidate( CoverState s )
{
    return s == CoverState::InlineOnly;
}

inline bool isMergeCandidate( CoverState s )
{
    return s == CoverState::PathOnly || s == CoverState::Both;
}

/* The inline payload can be dropped as the file is known */
inline bool isClearable( CoverState s )
{
    return s == CoverState::Both;
}

const char* toString( CoverState s );

}
