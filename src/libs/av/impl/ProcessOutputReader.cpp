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


#include "ProcessOutputReader.hpp"

#include "core/ILogger.hpp"

namespace vtrans::av
{
    ProcessOutputReader::ProcessOutputReader(std::unique_ptr<core::IChildProcess> process, LineCallback lineCallback, ExitCallback exitCallback)
        : _process{ std::move(process) }
        , _lineCallback{ std::move(lineCallback) }
        , _exitCallback{ std::move(exitCallback) }
    {
    }

    ProcessOutputReader::~ProcessOutputReader() = default;

    void ProcessOutputReader::start()
    {
        if (_stopped)
            return;

        readSome(_stdout);
        readSome(_stderr);
    }

    void ProcessOutputReader::kill()
    {
        _stopped = true;
        _process->kill();
    }

    void ProcessOutputReader::readSome(StreamState& state)
    {
        _process->asyncRead(state.stream, state.buffer.data(), state.buffer.size(), [self = shared_from_this(), &state](core::IChildProcess::ReadResult result, std::size_t bytesRead) {
            self->onRead(state, result, bytesRead);
        });
    }

    void ProcessOutputReader::onRead(StreamState& state, core::IChildProcess::ReadResult result, std::size_t bytesRead)
    {
        if (_stopped)
            return;

        processData(state, std::string_view{ reinterpret_cast<const char*>(state.buffer.data()), bytesRead });

        // a line callback may have stopped us
        if (_stopped)
            return;

        switch (result)
        {
        case core::IChildProcess::ReadResult::Success:
            readSome(state);
            break;

        case core::IChildProcess::ReadResult::Error:
            VTRANS_LOG(CHILDPROCESS, WARNING, "Read error on child process output, stop reading it");
            onStreamEnded(state);
            break;

        case core::IChildProcess::ReadResult::EndOfFile:
            onStreamEnded(state);
            break;
        }
    }

    void ProcessOutputReader::processData(StreamState& state, std::string_view data)
    {
        for (const char c : data)
        {
            if (c == '\n' || c == '\r')
            {
                if (_stopped)
                    return;

                if (!state.pendingLine.empty())
                {
                    _lineCallback(state.stream, state.pendingLine);
                    state.pendingLine.clear();
                }
            }
            else
                state.pendingLine.push_back(c);
        }
    }

    void ProcessOutputReader::onStreamEnded(StreamState& state)
    {
        // unterminated last line
        if (!state.pendingLine.empty() && !_stopped)
        {
            _lineCallback(state.stream, state.pendingLine);
            state.pendingLine.clear();
        }

        if (--_openStreamCount > 0)
            return;

        const core::IChildProcess::ExitStatus exitStatus{ _process->wait() };
        if (_stopped)
            return;

        _exitCallback(exitStatus);
    }
} // namespace vtrans::av
