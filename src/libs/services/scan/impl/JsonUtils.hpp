/*
 * Copyright (C) 2026 The ShelfScan authors
 *
 * This file is part of ShelfScan.
 *
 * ShelfScan is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * ShelfScan is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with ShelfScan.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <optional>
#include <string>

#include <Wt/Json/Object.h>
#include <Wt/Json/Value.h>

namespace shelfscan::scan::json
{
    // nullopt if missing, null or of another type
    inline std::optional<std::string> getOptionalString(const Wt::Json::Object& object, const std::string& key)
    {
        if (object.type(key) != Wt::Json::Type::String)
            return std::nullopt;

        return static_cast<std::string>(object.get(key));
    }

    inline std::optional<double> getOptionalNumber(const Wt::Json::Object& object, const std::string& key)
    {
        if (object.type(key) != Wt::Json::Type::Number)
            return std::nullopt;

        return static_cast<double>(object.get(key));
    }

    inline std::optional<long long> getOptionalInteger(const Wt::Json::Object& object, const std::string& key)
    {
        if (object.type(key) != Wt::Json::Type::Number)
            return std::nullopt;

        return static_cast<long long>(object.get(key));
    }

    inline std::optional<bool> getOptionalBool(const Wt::Json::Object& object, const std::string& key)
    {
        if (object.type(key) != Wt::Json::Type::Bool)
            return std::nullopt;

        return static_cast<bool>(object.get(key));
    }
} // namespace shelfscan::scan::json
