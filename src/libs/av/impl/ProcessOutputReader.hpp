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

#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "core/IChildProcess.hpp"

namespace vtrans::av
{
    // Reads both output streams of a child process line by line
    // Once both streams are over, reaps the process and reports its exit status
    // Pending reads keep this object alive: it must be owned by a shared_ptr
    class ProcessOutputReader : public std::enable_shared_from_this<ProcessOutputReader>
    {
    public:
        using OutputStream = core::IChildProcess::OutputStream;
        using LineCallback = std::function<void(OutputStream stream, std::string_view line)>;
        using ExitCallback = std::function<void(const core::IChildProcess::ExitStatus& exitStatus)>;

        ProcessOutputReader(std::unique_ptr<core::IChildProcess> process, LineCallback lineCallback, ExitCallback exitCallback);
        ~ProcessOutputReader();
        ProcessOutputReader(const ProcessOutputReader&) = delete;
        ProcessOutputReader& operator=(const ProcessOutputReader&) = delete;

        void start();

        // Kills and reaps the process, no callback is called afterwards
        void kill();

    private:
        static constexpr std::size_t readBufferSize{ 16 * 1024 };

        struct StreamState
        {
            const OutputStream stream;
            std::array<std::byte, readBufferSize> buffer;
            std::string pendingLine;
        };

        void readSome(StreamState& state);
        void onRead(StreamState& state, core::IChildProcess::ReadResult result, std::size_t bytesRead);
        void processData(StreamState& state, std::string_view data);
        void onStreamEnded(StreamState& state);

        const std::unique_ptr<core::IChildProcess> _process;
        const LineCallback _lineCallback;
        const ExitCallback _exitCallback;
        StreamState _stdout{ OutputStream::Stdout, {}, {} };
        StreamState _stderr{ OutputStream::Stderr, {}, {} };
        std::atomic<std::size_t> _openStreamCount{ 2 };
        std::atomic<bool> _stopped{};
    };
} // namespace vtrans::av
