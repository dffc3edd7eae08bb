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

#include "core/MimeTypes.hpp"

#include <string>
#include <unordered_map>

#include "core/String.hpp"

namespace vtrans::core
{
    std::string_view getMimeType(const std::filesystem::path& fileExtension)
    {
        static const std::unordered_map<std::string, std::string_view> entries{
            // video
            { ".3g2", "video/3gpp2" },
            { ".3gp", "video/3gpp" },
            { ".asf", "video/x-ms-asf" },
            { ".avi", "video/x-msvideo" },
            { ".divx", "video/x-msvideo" },
            { ".f4v", "video/mp4" },
            { ".flv", "video/x-flv" },
            { ".h264", "video/h264" },
            { ".m2ts", "video/mp2t" },
            { ".m4v", "video/x-m4v" },
            { ".mk3d", "video/x-matroska" },
            { ".mkv", "video/x-matroska" },
            { ".mov", "video/quicktime" },
            { ".mp4", "video/mp4" },
            { ".mp4v", "video/mp4" },
            { ".mpeg", "video/mpeg" },
            { ".mpg", "video/mpeg" },
            { ".mpg4", "video/mp4" },
            { ".mts", "video/mp2t" },
            { ".ogv", "video/ogg" },
            { ".qt", "video/quicktime" },
            { ".ts", "video/mp2t" },
            { ".vob", "video/x-ms-vob" },
            { ".webm", "video/webm" },
            { ".wmv", "video/x-ms-wmv" },

            // audio
            { ".aac", "audio/aac" },
            { ".ac3", "audio/ac3" },
            { ".aif", "audio/x-aiff" },
            { ".aiff", "audio/x-aiff" },
            { ".flac", "audio/flac" },
            { ".m4a", "audio/mp4" },
            { ".m4b", "audio/mp4" },
            { ".mka", "audio/x-matroska" },
            { ".mp3", "audio/mpeg" },
            { ".oga", "audio/ogg" },
            { ".ogg", "audio/ogg" },
            { ".opus", "audio/opus" },
            { ".wav", "audio/x-wav" },
            { ".wma", "audio/x-ms-wma" },

            // application
            { ".mp4s", "application/mp4" },
            { ".m4p", "application/mp4" },
        };

        auto it{ entries.find(core::stringUtils::stringToLower(fileExtension.string())) };
        if (it == std::cend(entries))
            return defaultMimeType;

        return it->second;
    }
} // namespace vtrans::core
