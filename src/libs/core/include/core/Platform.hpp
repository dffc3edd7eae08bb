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

#include <filesystem>
#include <string_view>

namespace vtrans::core
{
    struct Platform
    {
        std::string_view os;   // "linux", "darwin", "win32", "freebsd", "openbsd", "netbsd" or "unknown"
        std::string_view arch; // "x64", "ia32", "arm64", "arm", "ppc64", "riscv64" or "unknown"

        bool isWindows() const { return os == "win32"; }
        // suffix appended to program names on this platform (".exe" on Windows)
        std::string_view getExecutableSuffix() const { return isWindows() ? ".exe" : ""; }
    };

    // Platform the program was built for
    Platform getHostPlatform();

    // Directory containing the running executable, empty if it cannot be determined
    std::filesystem::path getExecutableDirectory();
} // namespace vtrans::core
