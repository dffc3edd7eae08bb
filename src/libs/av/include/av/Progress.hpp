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

namespace vtrans::av
{
    // One block of the encoder progress report
    struct Progress
    {
        std::optional<std::size_t> frame;
        std::optional<float> fps;
        std::optional<float> bitrate; // kbit/s
        std::optional<std::size_t> totalSize; // bytes written so far
        std::optional<std::chrono::microseconds> outTime; // position reached in the output
        std::optional<float> speed; // compared to real time
        std::size_t dupFrames{};
        std::size_t dropFrames{};
        bool isEnd{}; // last report for this encoding
    };
} // namespace vtrans::av
