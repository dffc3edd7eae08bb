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
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "core/IChildProcess.hpp"

namespace vtrans::av
{
    // Fixed H.264/AAC fragmented MP4 encoding, progress reported on stdout
    core::IChildProcess::Args buildEncoderArgs(const std::filesystem::path& encoderPath, std::string_view input, const std::filesystem::path& output, std::optional<std::chrono::milliseconds> seek);

    // Container and streams description, as JSON on stdout
    core::IChildProcess::Args buildProberArgs(const std::filesystem::path& proberPath, std::string_view input);

    // seconds with 3 decimals
    std::string formatSeekOffset(std::chrono::milliseconds offset);
} // namespace vtrans::av
