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


#include <gtest/gtest.h>

#include "ProgressParser.hpp"

namespace vtrans::av::tests
{
    using namespace std::chrono_literals;

    TEST(ProgressParser, block)
    {
        ProgressParser parser;

        const char* lines[]{
            "frame=120",
            "fps=29.97",
            "stream_0_0_q=-1.0",
            "bitrate= 812.3kbits/s",
            "total_size=524336",
            "out_time_us=4004000",
            "out_time_ms=4004000",
            "out_time=00:00:04.004000",
            "dup_frames=2",
            "drop_frames=1",
            "speed=3.12x",
        };
        for (const char* line : lines)
            EXPECT_FALSE(parser.parseLine(line)) << line;

        const std::optional<Progress> progress{ parser.parseLine("progress=continue") };
        ASSERT_TRUE(progress);
        EXPECT_EQ(progress->frame, 120);
        EXPECT_EQ(progress->fps, 29.97f);
        EXPECT_EQ(progress->bitrate, 812.3f);
        EXPECT_EQ(progress->totalSize, 524336);
        EXPECT_EQ(progress->outTime, 4'004'000us);
        EXPECT_EQ(progress->speed, 3.12f);
        EXPECT_EQ(progress->dupFrames, 2);
        EXPECT_EQ(progress->dropFrames, 1);
        EXPECT_FALSE(progress->isEnd);
    }

    TEST(ProgressParser, notAvailable)
    {
        ProgressParser parser;

        EXPECT_FALSE(parser.parseLine("frame=0"));
        EXPECT_FALSE(parser.parseLine("bitrate=N/A"));
        EXPECT_FALSE(parser.parseLine("total_size=N/A"));
        EXPECT_FALSE(parser.parseLine("out_time_us=N/A"));
        EXPECT_FALSE(parser.parseLine("speed=N/A"));

        const std::optional<Progress> progress{ parser.parseLine("progress=continue") };
        ASSERT_TRUE(progress);
        EXPECT_EQ(progress->frame, 0);
        EXPECT_FALSE(progress->bitrate);
        EXPECT_FALSE(progress->totalSize);
        EXPECT_FALSE(progress->outTime);
        EXPECT_FALSE(progress->speed);
    }

    TEST(ProgressParser, blocksAreIndependent)
    {
        ProgressParser parser;

        EXPECT_FALSE(parser.parseLine("frame=10"));
        ASSERT_TRUE(parser.parseLine("progress=continue"));

        const std::optional<Progress> progress{ parser.parseLine("progress=end") };
        ASSERT_TRUE(progress);
        EXPECT_FALSE(progress->frame);
        EXPECT_TRUE(progress->isEnd);
    }

    TEST(ProgressParser, unexpectedLines)
    {
        ProgressParser parser;

        EXPECT_FALSE(parser.parseLine(""));
        EXPECT_FALSE(parser.parseLine("garbage"));
        EXPECT_FALSE(parser.parseLine("unknown_key=12"));
        EXPECT_FALSE(parser.parseLine("frame=abc"));

        const std::optional<Progress> progress{ parser.parseLine("  progress=continue\r") };
        ASSERT_TRUE(progress);
        EXPECT_FALSE(progress->frame);
        EXPECT_FALSE(progress->isEnd);
    }
} // namespace vtrans::av::tests
