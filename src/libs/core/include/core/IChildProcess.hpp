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

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/Exception.hpp"

namespace vtrans::core
{
    class ChildProcessException : public VtransException
    {
    public:
        using VtransException::VtransException;
    };

    class IChildProcess
    {
    public:
        using Args = std::vector<std::string>;

        virtual ~IChildProcess() = default;

        enum class OutputStream
        {
            Stdout,
            Stderr,
        };

        enum class ReadResult
        {
            Success,
            Error,
            EndOfFile,
        };

        struct ExitStatus
        {
            std::optional<int> exitCode;   // set if the process exited normally
            std::optional<int> termSignal; // set if the process was terminated by a signal

            bool succeeded() const { return exitCode && *exitCode == 0; }
        };

        // Reads whatever is available on the given output stream, at most bufferSize bytes
        // The callback is not called if the process is destroyed before the read completes
        using ReadCallback = std::function<void(ReadResult, std::size_t)>;
        virtual void asyncRead(OutputStream stream, std::byte* data, std::size_t bufferSize, ReadCallback callback) = 0;

        // Sends SIGKILL and reaps the process, no-op if already reaped
        virtual void kill() = 0;

        // Blocks until the process is reaped
        virtual ExitStatus wait() = 0;
    };
} // namespace vtrans::core
