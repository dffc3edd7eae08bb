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

#include <string_view>

#include "av/MediaMetadata.hpp"

namespace vtrans::av
{
    // Parses the JSON document written by the prober
    // throws ProbeException on malformed document
    MediaMetadata parseMediaMetadata(std::string_view json);
} // namespace vtrans::av
