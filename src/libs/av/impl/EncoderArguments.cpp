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


#include "EncoderArguments.hpp"

#include <iomanip>
#include <sstream>

namespace vtrans::av
{
    std::string formatSeekOffset(std::chrono::milliseconds offset)
    {
        std::ostringstream oss;
        oss << offset.count() / 1'000 << '.' << std::setw(3) << std::setfill('0') << offset.count() % 1'000;
        return oss.str();
    }

    core::IChildProcess::Args buildEncoderArgs(const std::filesystem::path& encoderPath, std::string_view input, const std::filesystem::path& output, std::optional<std::chrono::milliseconds> seek)
    {
        core::IChildProcess::Args args;

        args.emplace_back(encoderPath.string());

        // Make sure:
        // - stderr only carries errors
        // - we do not rely on input
        // in order not to block the whole forked process
        args.emplace_back("-hide_banner");
        args.emplace_back("-loglevel");
        args.emplace_back("error");
        args.emplace_back("-nostdin");
        args.emplace_back("-nostats");

        // Progress reports as key=value lines
        args.emplace_back("-progress");
        args.emplace_back("pipe:1");

        // Overwrite output
        args.emplace_back("-y");

        // Input offset, must be set before the input to seek in the input
        if (seek)
        {
            args.emplace_back("-ss");
            args.emplace_back(formatSeekOffset(*seek));
        }

        // Input file
        args.emplace_back("-i");
        args.emplace_back(input);

        // Codecs
        args.emplace_back("-c:v");
        args.emplace_back("libx264");
        args.emplace_back("-c:a");
        args.emplace_back("aac");
        args.emplace_back("-threads");
        args.emplace_back("1");
        args.emplace_back("-crf");
        args.emplace_back("22");

        // Playable while being written
        args.emplace_back("-movflags");
        args.emplace_back("+faststart+frag_keyframe+empty_moov+default_base_moof");

        args.emplace_back("-preset");
        args.emplace_back("ultrafast");
        args.emplace_back("-tune");
        args.emplace_back("zerolatency");

        // Format
        args.emplace_back("-f");
        args.emplace_back("mp4");

        args.emplace_back(output.string());

        return args;
    }

    core::IChildProcess::Args buildProberArgs(const std::filesystem::path& proberPath, std::string_view input)
    {
        return core::IChildProcess::Args{
            proberPath.string(),
            "-v",
            "error",
            "-print_format",
            "json",
            "-show_format",
            "-show_streams",
            std::string{ input },
        };
    }
} // namespace vtrans::av
