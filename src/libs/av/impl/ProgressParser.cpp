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


#include "ProgressParser.hpp"

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace vtrans::av
{
    std::optional<Progress> ProgressParser::parseLine(std::string_view line)
    {
        line = core::stringUtils::stringTrim(line);

        const std::size_t separatorPos{ line.find('=') };
        if (separatorPos == std::string_view::npos)
        {
            VTRANS_LOG_IF(TRANSCODING, DEBUG, !line.empty(), "Skipping unexpected progress line '" << line << "'");
            return std::nullopt;
        }

        const std::string_view key{ core::stringUtils::stringTrim(line.substr(0, separatorPos)) };
        const std::string_view value{ core::stringUtils::stringTrim(line.substr(separatorPos + 1)) };

        // N/A values are not parsable as numbers and are therefore left unset
        if (key == "frame")
            _current.frame = core::stringUtils::readAs<std::size_t>(value);
        else if (key == "fps")
            _current.fps = core::stringUtils::readAs<float>(value);
        else if (key == "bitrate") // "1234.5kbits/s"
            _current.bitrate = core::stringUtils::readAs<float>(value);
        else if (key == "total_size")
            _current.totalSize = core::stringUtils::readAs<std::size_t>(value);
        else if (key == "out_time_us")
        {
            if (const auto outTime{ core::stringUtils::readAs<long long>(value) })
                _current.outTime = std::chrono::microseconds{ *outTime };
            else
                _current.outTime.reset();
        }
        else if (key == "speed") // "1.5x"
            _current.speed = core::stringUtils::readAs<float>(value);
        else if (key == "dup_frames")
            _current.dupFrames = core::stringUtils::readAs<std::size_t>(value).value_or(0);
        else if (key == "drop_frames")
            _current.dropFrames = core::stringUtils::readAs<std::size_t>(value).value_or(0);
        else if (key == "progress")
        {
            Progress progress{ _current };
            progress.isEnd = (value == "end");
            _current = Progress{};

            return progress;
        }

        return std::nullopt;
    }
} // namespace vtrans::av
