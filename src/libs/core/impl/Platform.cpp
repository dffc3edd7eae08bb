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

#include "core/Platform.hpp"

#include <system_error>

#include "core/ILogger.hpp"

namespace vtrans::core
{
    Platform getHostPlatform()
    {
        Platform platform;

#if defined(_WIN32)
        platform.os = "win32";
#elif defined(__APPLE__)
        platform.os = "darwin";
#elif defined(__linux__)
        platform.os = "linux";
#elif defined(__FreeBSD__)
        platform.os = "freebsd";
#elif defined(__OpenBSD__)
        platform.os = "openbsd";
#elif defined(__NetBSD__)
        platform.os = "netbsd";
#else
        platform.os = "unknown";
#endif

        // Architecture of this build, not of the host OS: a 32-bit build on a 64-bit OS reports "ia32"
        // Only used to name the bundled executables in diagnostics
#if defined(__x86_64__) || defined(_M_X64)
        platform.arch = "x64";
#elif defined(__i386__) || defined(_M_IX86)
        platform.arch = "ia32";
#elif defined(__aarch64__) || defined(_M_ARM64)
        platform.arch = "arm64";
#elif defined(__arm__) || defined(_M_ARM)
        platform.arch = "arm";
#elif defined(__powerpc64__)
        platform.arch = "ppc64";
#elif defined(__riscv) && (__riscv_xlen == 64)
        platform.arch = "riscv64";
#else
        platform.arch = "unknown";
#endif

        return platform;
    }

    std::filesystem::path getExecutableDirectory()
    {
        std::error_code ec;
        const std::filesystem::path exePath{ std::filesystem::read_symlink("/proc/self/exe", ec) };
        if (ec)
        {
            VTRANS_LOG(UTILS, DEBUG, "Cannot read executable path: " << ec.message());
            return {};
        }

        return exePath.parent_path();
    }
} // namespace vtrans::core
