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

#include "av/Exception.hpp"

#include "MetadataParser.hpp"

namespace vtrans::av::tests
{
    using namespace std::chrono_literals;

    TEST(MetadataParser, videoFile)
    {
        constexpr std::string_view json{ R"({
    "streams": [
        {
            "index": 0,
            "codec_name": "h264",
            "codec_long_name": "H.264 / AVC / MPEG-4 AVC / MPEG-4 part 10",
            "codec_type": "video",
            "width": 1920,
            "height": 1080,
            "r_frame_rate": "24000/1001"
        },
        {
            "index": 1,
            "codec_name": "ac3",
            "codec_type": "audio",
            "sample_rate": "48000",
            "channels": 6
        },
        {
            "index": 2,
            "codec_name": "subrip",
            "codec_type": "subtitle"
        }
    ],
    "format": {
        "filename": "movie.mkv",
        "nb_streams": 3,
        "format_name": "matroska,webm",
        "duration": "5423.104000",
        "size": "2199023255",
        "bit_rate": "3243960",
        "tags": {
            "title": "Movie"
        }
    }
})" };

        const MediaMetadata metadata{ parseMediaMetadata(json) };

        EXPECT_EQ(metadata.rawJson, json);
        EXPECT_EQ(metadata.formatNames, (std::vector<std::string>{ "matroska", "webm" }));
        EXPECT_EQ(metadata.duration, 5'423'104ms);
        EXPECT_EQ(metadata.bitrate, 3243960);

        ASSERT_EQ(metadata.streams.size(), 3);

        EXPECT_EQ(metadata.streams[0].index, 0);
        EXPECT_EQ(metadata.streams[0].type, StreamType::Video);
        EXPECT_EQ(metadata.streams[0].codecName, "h264");
        EXPECT_EQ(metadata.streams[0].width, 1920);
        EXPECT_EQ(metadata.streams[0].height, 1080);
        EXPECT_FALSE(metadata.streams[0].sampleRate);

        EXPECT_EQ(metadata.streams[1].index, 1);
        EXPECT_EQ(metadata.streams[1].type, StreamType::Audio);
        EXPECT_EQ(metadata.streams[1].codecName, "ac3");
        EXPECT_EQ(metadata.streams[1].sampleRate, 48000);
        EXPECT_EQ(metadata.streams[1].channelCount, 6);
        EXPECT_FALSE(metadata.streams[1].width);

        EXPECT_EQ(metadata.streams[2].type, StreamType::Subtitle);
        EXPECT_STREQ(getStreamTypeName(metadata.streams[2].type), "subtitle");
    }

    TEST(MetadataParser, missingOptionalFields)
    {
        const MediaMetadata metadata{ parseMediaMetadata(R"({ "streams": [ { "index": 0, "codec_type": "video" } ], "format": { "duration": "N/A" } })") };

        EXPECT_TRUE(metadata.formatNames.empty());
        EXPECT_FALSE(metadata.duration);
        EXPECT_FALSE(metadata.bitrate);
        ASSERT_EQ(metadata.streams.size(), 1);
        EXPECT_TRUE(metadata.streams[0].codecName.empty());
        EXPECT_FALSE(metadata.streams[0].width);
    }

    TEST(MetadataParser, unknownStreamType)
    {
        const MediaMetadata metadata{ parseMediaMetadata(R"({ "streams": [ { "index": 0, "codec_type": "hologram" } ] })") };

        ASSERT_EQ(metadata.streams.size(), 1);
        EXPECT_EQ(metadata.streams[0].type, StreamType::Unknown);
        EXPECT_STREQ(getStreamTypeName(metadata.streams[0].type), "unknown");
    }

    TEST(MetadataParser, malformed)
    {
        EXPECT_THROW(parseMediaMetadata(""), ProbeException);
        EXPECT_THROW(parseMediaMetadata("not json"), ProbeException);
        EXPECT_THROW(parseMediaMetadata("{ \"format\": "), ProbeException);
        EXPECT_THROW(parseMediaMetadata("{}"), ProbeException);
        EXPECT_THROW(parseMediaMetadata(R"({ "streams": [ 42 ] })"), ProbeException);
        EXPECT_THROW(parseMediaMetadata(R"({ "streams": [ { "codec_type": "video" } ] })"), ProbeException);
    }
} // namespace vtrans::av::tests
