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


#include "MetadataParser.hpp"

#include <chrono>
#include <cmath>
#include <string>
#include <type_traits>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>

#include "av/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace vtrans::av
{
    namespace
    {
        std::optional<std::string> getString(const Wt::Json::Object& object, const std::string& name)
        {
            if (object.type(name) != Wt::Json::Type::String)
                return std::nullopt;

            return static_cast<std::string>(object.get(name));
        }

        // Numbers are written either as JSON numbers or as strings depending on the field
        template<typename T>
        std::optional<T> getNumber(const Wt::Json::Object& object, const std::string& name)
        {
            switch (object.type(name))
            {
            case Wt::Json::Type::Number:
                if constexpr (std::is_floating_point_v<T>)
                    return static_cast<T>(static_cast<double>(object.get(name)));
                else
                    return static_cast<T>(static_cast<long long>(object.get(name)));

            case Wt::Json::Type::String:
                return core::stringUtils::readAs<T>(static_cast<std::string>(object.get(name)));

            default:
                return std::nullopt;
            }
        }

        StreamType parseStreamType(std::string_view codecType)
        {
            if (codecType == "video")
                return StreamType::Video;
            if (codecType == "audio")
                return StreamType::Audio;
            if (codecType == "subtitle")
                return StreamType::Subtitle;
            if (codecType == "data")
                return StreamType::Data;
            if (codecType == "attachment")
                return StreamType::Attachment;

            return StreamType::Unknown;
        }

        StreamInfo parseStream(const Wt::Json::Object& streamObj)
        {
            const std::optional<std::size_t> index{ getNumber<std::size_t>(streamObj, "index") };
            if (!index)
                throw ProbeException{ "Stream has no index" };

            StreamInfo stream;
            stream.index = *index;
            stream.type = parseStreamType(getString(streamObj, "codec_type").value_or(""));
            stream.codecName = getString(streamObj, "codec_name").value_or("");

            switch (stream.type)
            {
            case StreamType::Video:
                stream.width = getNumber<unsigned>(streamObj, "width");
                stream.height = getNumber<unsigned>(streamObj, "height");
                break;

            case StreamType::Audio:
                stream.sampleRate = getNumber<unsigned>(streamObj, "sample_rate");
                stream.channelCount = getNumber<unsigned>(streamObj, "channels");
                break;

            default:
                break;
            }

            return stream;
        }

        void parseFormat(const Wt::Json::Object& formatObj, MediaMetadata& metadata)
        {
            if (const std::optional<std::string> formatName{ getString(formatObj, "format_name") })
            {
                for (std::string_view name : core::stringUtils::splitString(*formatName, ','))
                {
                    if (!name.empty())
                        metadata.formatNames.emplace_back(name);
                }
            }

            if (const std::optional<double> duration{ getNumber<double>(formatObj, "duration") })
                metadata.duration = std::chrono::milliseconds{ std::llround(*duration * 1'000) };

            metadata.bitrate = getNumber<std::size_t>(formatObj, "bit_rate");
        }
    } // namespace

    const char* getStreamTypeName(StreamType type)
    {
        switch (type)
        {
        case StreamType::Video:
            return "video";
        case StreamType::Audio:
            return "audio";
        case StreamType::Subtitle:
            return "subtitle";
        case StreamType::Data:
            return "data";
        case StreamType::Attachment:
            return "attachment";
        case StreamType::Unknown:
            break;
        }
        return "unknown";
    }

    MediaMetadata parseMediaMetadata(std::string_view json)
    {
        MediaMetadata metadata;
        metadata.rawJson = json;

        try
        {
            Wt::Json::Object root;
            Wt::Json::parse(std::string{ json }, root);

            if (root.type("format") != Wt::Json::Type::Object && root.type("streams") != Wt::Json::Type::Array)
                throw ProbeException{ "No format nor streams found" };

            if (root.type("format") == Wt::Json::Type::Object)
                parseFormat(root.get("format"), metadata);

            if (root.type("streams") == Wt::Json::Type::Array)
            {
                const Wt::Json::Array& streams = root.get("streams");
                for (const Wt::Json::Value& value : streams)
                    metadata.streams.push_back(parseStream(value));
            }
        }
        catch (const Wt::WException& error)
        {
            throw ProbeException{ std::string{ "Cannot parse prober output: " } + error.what() };
        }

        VTRANS_LOG(PROBE, DEBUG, "Parsed metadata: " << metadata.formatNames.size() << " format names, " << metadata.streams.size() << " streams");

        return metadata;
    }
} // namespace vtrans::av
