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

#include <Wt/WDate.h>
#include <Wt/WDateTime.h>
#include <Wt/WTime.h>

#include "core/String.hpp"

namespace vtrans::core::stringUtils::tests
{
    TEST(StringUtils, splitString)
    {
        struct TestCase
        {
            std::string_view input;
            char delimiter;
            std::vector<std::string_view> expectedOutput;
        };

        TestCase tests[]{
            { "abc", '-', { "abc" } },
            { "", '-', { "" } },
            { "a-b-c", '-', { "a", "b", "c" } },
            { ";b;c", ';', { "", "b", "c" } },
            { ";;", ';', { "", "", "" } },
            { "mov,mp4,m4a,3gp,3g2,mj2", ',', { "mov", "mp4", "m4a", "3gp", "3g2", "mj2" } },
            { "out_time_us=1000", '=', { "out_time_us", "1000" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> res{ splitString(test.input, test.delimiter) };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "', delims = '" << test.delimiter << "'";
        }
    }

    TEST(StringUtils, joinStrings)
    {
        struct TestCase
        {
            std::vector<std::string> input;
            std::string delimiter;
            std::string expectedOutput;
        };

        TestCase tests[]{
            { { "a", "b", "c" }, "-", "a-b-c" },
            { { "a", "b", "c" }, "***", "a***b***c" },
            { { "a", "", "c" }, "-", "a--c" },
            { { "", "b", "c" }, "-", "-b-c" },
            { { "a" }, "-", "a" },
            { {}, "-", "" },
        };

        for (const TestCase& test : tests)
        {
            const std::string str{ joinStrings(test.input, test.delimiter) };
            EXPECT_EQ(str, test.expectedOutput);
        }

        const std::vector<std::string> args{ "ffmpeg", "-i", "in.avi" };
        EXPECT_EQ(joinStrings(args, ' '), "ffmpeg -i in.avi");
    }

    TEST(StringUtils, stringTrim)
    {
        EXPECT_EQ(stringTrim(""), "");
        EXPECT_EQ(stringTrim("   "), "");
        EXPECT_EQ(stringTrim(" a "), "a");
        EXPECT_EQ(stringTrim("\ta b\r"), "a b");
        EXPECT_EQ(stringTrim("--a--", "-"), "a");
    }

    TEST(StringUtils, stringToLower)
    {
        EXPECT_EQ(stringToLower(".MKV"), ".mkv");
        EXPECT_EQ(stringToLower(""), "");
        EXPECT_EQ(stringToLower("FooBar"), "foobar");
    }

    TEST(StringUtils, stringCaseInsensitiveEqual)
    {
        EXPECT_TRUE(stringCaseInsensitiveEqual("debug", "DEBUG"));
        EXPECT_TRUE(stringCaseInsensitiveEqual("", ""));
        EXPECT_FALSE(stringCaseInsensitiveEqual("debug", "debu"));
        EXPECT_FALSE(stringCaseInsensitiveEqual("info", "warn"));
    }

    TEST(StringUtils, readAs_int)
    {
        EXPECT_EQ(readAs<int>("1024"), 1024);
        EXPECT_EQ(readAs<int>("0"), 0);
        EXPECT_EQ(readAs<int>("-1"), -1);
        EXPECT_EQ(readAs<int>(""), std::nullopt);
        EXPECT_EQ(readAs<int>("a"), std::nullopt);
        EXPECT_EQ(readAs<int>("1024a"), 1024);
        EXPECT_EQ(readAs<int>("a1024a"), std::nullopt);
    }

    TEST(StringUtils, readAs_double)
    {
        EXPECT_EQ(readAs<double>("1.5"), 1.5);
        EXPECT_EQ(readAs<double>("25"), 25.0);
        EXPECT_EQ(readAs<double>("N/A"), std::nullopt);
    }

    TEST(Stringutils, DateTimeToString)
    {
        {
            const Wt::WDateTime dateTime{ Wt::WDate{ 2020, 01, 03 }, Wt::WTime{ 9, 8, 11, 75 } };
            EXPECT_EQ(toISO8601String(dateTime), "2020-01-03T09:08:11.075Z");
        }

        {
            const Wt::WDateTime dateTime;
            EXPECT_EQ(toISO8601String(dateTime), "");
        }
    }

    TEST(StringUtils, stringEndsWith)
    {
        EXPECT_TRUE(stringEndsWith("video/mp4", "mp4"));
        EXPECT_TRUE(stringEndsWith("FooBar", ""));
        EXPECT_TRUE(stringEndsWith("", ""));
        EXPECT_TRUE(stringEndsWith("FooBar", "FooBar"));
        EXPECT_FALSE(stringEndsWith("FooBar", "1FooBar"));
        EXPECT_FALSE(stringEndsWith("video/mp4v", "mp4"));
    }
} // namespace vtrans::core::stringUtils::tests
