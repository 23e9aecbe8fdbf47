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

#include <string_view>

#include "services/scan/StreamEvent.hpp"

namespace Wt::Json
{
    class Object;
}

namespace shelfscan::scan
{
    // Turns a named event record into a typed event
    // Unknown names give UnknownIgnorable
    // throws MalformedEventException if the payload does not match the event
    StreamEvent parseEvent(std::string_view name, std::string_view data);

    // throws Wt::WException on missing title/author
    BookMetadata parseBook(const Wt::Json::Object& bookObject);
} // namespace shelfscan::scan
