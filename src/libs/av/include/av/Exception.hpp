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

#include <optional>
#include <string>

#include "core/Exception.hpp"

namespace vtrans::av
{
    class Exception : public core::VtransException
    {
    public:
        using VtransException::VtransException;
    };

    // The encoder failed to start, exited with an error or was terminated by a signal
    class EncodingException : public Exception
    {
    public:
        EncodingException(const std::string& message, std::optional<int> exitCode = std::nullopt)
            : Exception{ message }
            , _exitCode{ exitCode }
        {
        }

        std::optional<int> getExitCode() const { return _exitCode; }

    private:
        std::optional<int> _exitCode;
    };

    class ProbeException : public Exception
    {
    public:
        using Exception::Exception;
    };

    // The job was stopped before its completion
    class JobCancelledException : public Exception
    {
    public:
        JobCancelledException()
            : Exception{ "Transcode job cancelled" } {}

    protected:
        using Exception::Exception;
    };

    // The job was superseded by a newer transcode request
    class PreemptedException : public JobCancelledException
    {
    public:
        PreemptedException()
            : JobCancelledException{ "Transcode job preempted by a new request" } {}
    };
} // namespace vtrans::av
