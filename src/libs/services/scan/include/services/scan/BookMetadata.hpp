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
#include <vector>

namespace shelfscan::scan
{
    struct BookMetadata
    {
        std::string title;
        std::string author;
        std::optional<std::string> isbn;
        std::optional<std::string> coverUrl;
        std::optional<std::string> publisher;
        std::optional<std::string> publishedDate;
        std::optional<int> pageCount;
        std::optional<std::string> format;
        std::optional<double> confidence; // in [0, 1]

        std::string rawJson; // as received, for diagnostics

        bool operator==(const BookMetadata&) const = default;
    };

    using BookList = std::vector<BookMetadata>;
} // namespace shelfscan::scan
