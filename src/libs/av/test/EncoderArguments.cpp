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


#include <algorithm>

#include <gtest/gtest.h>

#include "EncoderArguments.hpp"

namespace vtrans::av::tests
{
    using namespace std::chrono_literals;

    TEST(EncoderArguments, withoutSeek)
    {
        const core::IChildProcess::Args args{ buildEncoderArgs("ffmpeg", "in.mkv", "out.mp4", std::nullopt) };

        const core::IChildProcess::Args expectedArgs{
            "ffmpeg",
            "-hide_banner",
            "-loglevel",
            "error",
            "-nostdin",
            "-nostats",
            "-progress",
            "pipe:1",
            "-y",
            "-i",
            "in.mkv",
            "-c:v",
            "libx264",
            "-c:a",
            "aac",
            "-threads",
            "1",
            "-crf",
            "22",
            "-movflags",
            "+faststart+frag_keyframe+empty_moov+default_base_moof",
            "-preset",
            "ultrafast",
            "-tune",
            "zerolatency",
            "-f",
            "mp4",
            "out.mp4",
        };
        EXPECT_EQ(args, expectedArgs);
    }

    TEST(EncoderArguments, seekBeforeInput)
    {
        const core::IChildProcess::Args args{ buildEncoderArgs("/opt/vendor/ffmpeg", "http://host/in.avi", "/tmp/out.mp4", 30s) };

        const auto seekIt{ std::find(std::cbegin(args), std::cend(args), "-ss") };
        const auto inputIt{ std::find(std::cbegin(args), std::cend(args), "-i") };
        ASSERT_NE(seekIt, std::cend(args));
        ASSERT_NE(inputIt, std::cend(args));
        EXPECT_LT(seekIt, inputIt);
        EXPECT_EQ(*(seekIt + 1), "30.000");
        EXPECT_EQ(*(inputIt + 1), "http://host/in.avi");
        EXPECT_EQ(args.front(), "/opt/vendor/ffmpeg");
        EXPECT_EQ(args.back(), "/tmp/out.mp4");
    }

    TEST(EncoderArguments, seekOffsetFormat)
    {
        EXPECT_EQ(formatSeekOffset(0ms), "0.000");
        EXPECT_EQ(formatSeekOffset(5s), "5.000");
        EXPECT_EQ(formatSeekOffset(1'234ms), "1.234");
        EXPECT_EQ(formatSeekOffset(3'600'005ms), "3600.005");
    }

    TEST(EncoderArguments, prober)
    {
        const core::IChildProcess::Args args{ buildProberArgs("ffprobe", "in.mkv") };

        const core::IChildProcess::Args expectedArgs{ "ffprobe", "-v", "error", "-print_format", "json", "-show_format", "-show_streams", "in.mkv" };
        EXPECT_EQ(args, expectedArgs);
    }
} // namespace vtrans::av::tests
