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

#include "core/Platform.hpp"

namespace vtrans::core::tests
{
    TEST(Platform, host)
    {
        const Platform platform{ getHostPlatform() };

        EXPECT_FALSE(platform.os.empty());
        EXPECT_FALSE(platform.arch.empty());
#if defined(__linux__)
        EXPECT_EQ(platform.os, "linux");
        EXPECT_FALSE(platform.isWindows());
        EXPECT_EQ(platform.getExecutableSuffix(), "");
#endif
    }

    TEST(Platform, windowsSuffix)
    {
        const Platform platform{ "win32", "x64" };

        EXPECT_TRUE(platform.isWindows());
        EXPECT_EQ(platform.getExecutableSuffix(), ".exe");
    }

    TEST(Platform, executableDirectory)
    {
        const std::filesystem::path directory{ getExecutableDirectory() };

        ASSERT_FALSE(directory.empty());
        EXPECT_TRUE(std::filesystem::is_directory(directory));
    }
} // namespace vtrans::core::tests
