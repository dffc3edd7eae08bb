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

#include <sys/types.h>
#include <unistd.h>

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "core/IChildProcess.hpp"

namespace vtrans::core
{
    class ChildProcess : public IChildProcess
    {
    public:
        ChildProcess(boost::asio::io_context& ioContext, const std::filesystem::path& path, const Args& args);
        ~ChildProcess() override;

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

    private:
        void asyncRead(OutputStream stream, std::byte* data, std::size_t bufferSize, ReadCallback callback) override;
        void kill() override;
        ExitStatus wait() override;

        void reap(); // _mutex must be held

        using FileDescriptor = boost::asio::posix::stream_descriptor;

        FileDescriptor& getDescriptor(OutputStream stream);

        boost::asio::io_context& _ioContext;
        FileDescriptor _childStdout;
        FileDescriptor _childStderr;
        ::pid_t _childPID{};

        std::mutex _mutex;
        std::optional<ExitStatus> _exitStatus; // set once reaped
    };
} // namespace vtrans::core
