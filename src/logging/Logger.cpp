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

#include "Logger.h"
#include "IostreamLogger.h"

namespace coverlibrary
{

std::shared_ptr<ILogger> Log::s_logger = std::make_shared<IostreamLogger>();
std::atomic<LogLevel> Log::s_logLevel{ LogLevel::Error };

void Log::SetLogger( std::shared_ptr<ILogger> logger )
{
    if ( logger == nullptr )
        logger = std::make_shared<IostreamLogger>();
    std::atomic_store( &s_logger, std::move( logger ) );
}

void Log::doLog( LogLevel lvl, const std::string& msg )
{
    auto l = std::atomic_load( &s_logger );
    // In case we're logging early (as in, before the static default logger
    // has been constructed), don't blow up
    if ( l == nullptr )
        return;
    switch ( lvl )
    {
    case LogLevel::Error:
        l->Error( msg );
        break;
    case LogLevel::Warning:
        l->Warning( msg );
        break;
    case LogLevel::Info:
        l->Info( msg );
        break;
    case LogLevel::Debug:
        l->Debug( msg );
        break;
    case LogLevel::Verbose:
        l->Verbose( msg );
        break;
    }
}

}
