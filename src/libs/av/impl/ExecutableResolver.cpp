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


#include "av/ExecutableResolver.hpp"

#include <string>
#include <system_error>

#include "core/ILogger.hpp"

namespace vtrans::av
{
    namespace
    {
        std::optional<std::filesystem::path> resolveBundledProgram(std::string_view programName, const core::Platform& platform, const std::filesystem::path& vendorDirectory)
        {
            const std::filesystem::path path{ vendorDirectory / (std::string{ programName } + std::string{ platform.getExecutableSuffix() }) };

            std::error_code ec;
            const bool exists{ std::filesystem::is_regular_file(path, ec) };
            if (ec)
                VTRANS_LOG(RESOLVER, DEBUG, "Cannot check " << path << ": " << ec.message());

            if (!exists)
            {
                VTRANS_LOG(RESOLVER, WARNING, "No bundled " << programName << " for platform '" << platform.os << "' (" << platform.arch << "), expected " << path);
                return std::nullopt;
            }

            VTRANS_LOG(RESOLVER, DEBUG, "Found bundled " << programName << ": " << path);
            return path;
        }
    } // namespace

    std::optional<std::filesystem::path> resolveEncoderPath(const core::Platform& platform, const std::filesystem::path& vendorDirectory)
    {
        return resolveBundledProgram("ffmpeg", platform, vendorDirectory);
    }

    std::optional<std::filesystem::path> resolveProberPath(const core::Platform& platform, const std::filesystem::path& vendorDirectory)
    {
        return resolveBundledProgram("ffprobe", platform, vendorDirectory);
    }

    ExecutablePaths resolveExecutablePaths(const core::Platform& platform, const std::filesystem::path& vendorDirectory)
    {
        ExecutablePaths paths{
            .encoder = resolveEncoderPath(platform, vendorDirectory).value_or("ffmpeg"),
            .prober = resolveProberPath(platform, vendorDirectory).value_or("ffprobe"),
        };

        VTRANS_LOG(RESOLVER, INFO, "Using encoder " << paths.encoder << ", prober " << paths.prober);

        return paths;
    }
} // namespace vtrans::av
