/*
 * Copyright (C) 2025 The vtrans authors
 *
 * This file is part of vtrans.
 *
 * vtrans is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * vtrans is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with vtrans.  If not, see <http://www.gnu.org/licenses/>.
 */


#pragma once

#include <filesystem>
#include <optional>

#include "core/Platform.hpp"

namespace vtrans::av
{
    struct ExecutablePaths
    {
        std::filesystem::path encoder; // ffmpeg
        std::filesystem::path prober;  // ffprobe
    };

    // Look for the programs bundled in vendorDirectory, named after the platform conventions
    // Never throw, return std::nullopt if the program is not there
    std::optional<std::filesystem::path> resolveEncoderPath(const core::Platform& platform, const std::filesystem::path& vendorDirectory);
    std::optional<std::filesystem::path> resolveProberPath(const core::Platform& platform, const std::filesystem::path& vendorDirectory);

    // Bundled programs if any, bare program names to be looked up in PATH otherwise
    ExecutablePaths resolveExecutablePaths(const core::Platform& platform, const std::filesystem::path& vendorDirectory);
} // namespace vtrans::av
