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


#include "av/NeedsTranscoding.hpp"

#include "core/ILogger.hpp"
#include "core/MimeTypes.hpp"
#include "core/String.hpp"

namespace vtrans::av
{
    bool needsTranscoding(const std::filesystem::path& filename)
    {
        const std::string_view mimeType{ core::getMimeType(filename.extension()) };
        if (mimeType == core::defaultMimeType)
        {
            VTRANS_LOG(AV, DEBUG, "Unknown mime type for " << filename << ", assuming it needs transcoding");
            return true;
        }

        // video/mp4, audio/mp4, application/mp4
        return !core::stringUtils::stringEndsWith(mimeType, "/mp4");
    }
} // namespace vtrans::av
