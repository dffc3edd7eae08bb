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

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vtrans::av
{
    enum class StreamType
    {
        Video,
        Audio,
        Subtitle,
        Data,
        Attachment,
        Unknown,
    };

    struct StreamInfo
    {
        std::size_t index{};
        StreamType type{ StreamType::Unknown };
        std::string codecName;
        std::optional<unsigned> width;  // video only
        std::optional<unsigned> height; // video only
        std::optional<unsigned> sampleRate; // audio only
        std::optional<unsigned> channelCount; // audio only
    };

    struct MediaMetadata
    {
        std::string rawJson; // document as written by the prober
        std::vector<std::string> formatNames;
        std::optional<std::chrono::milliseconds> duration;
        std::optional<std::size_t> bitrate; // bit/s
        std::vector<StreamInfo> streams;
    };

    const char* getStreamTypeName(StreamType type);
} // namespace vtrans::av
