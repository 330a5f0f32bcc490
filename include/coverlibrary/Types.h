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
#include <vector>

namespace coverlibrary
{

class ICoverLibrary;
class ICoverStorage;
class ILogger;

using CoverStoragePtr = std::shared_ptr<ICoverStorage>;

enum class InitializeResult
{
    //< Everything worked out fine
    Success,
    //< Should be considered the same as Success, but is an indication of
    // unrequired subsequent calls to initialize.
    AlreadyInitialized,
    //< A fatal error occured, the ICoverLibrary instance should be destroyed
    Failed,
};

/**
 * @brief The MigrationProgress struct is returned by the inline migration and
 * by the path synchronization.
 *
 * When returned by a synchronization, tracksMigrated & albumsMigrated count
 * the rows which were synced.
 */
struct MigrationProgress
{
    size_t total = 0;
    size_t processed = 0;
    size_t tracksMigrated = 0;
    size_t albumsMigrated = 0;
    std::vector<std::string> errors;
};

struct MergeResult
{
    size_t coversMerged = 0;
    uint64_t spaceSavedBytes = 0;
    size_t albumsProcessed = 0;
    std::vector<std::string> errors;
};

}
