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
#include <string_view>

#include "services/scan/BookMetadata.hpp"
#include "IStreamClient.hpp"

namespace shelfscan::scan
{
    // nullopt if the body is not a successful submit response
    std::optional<SubmitResponse> parseSubmitResponse(std::string_view body);

    struct ProblemDetails
    {
        std::optional<std::string> message;
        std::optional<std::string> code;
        std::optional<bool> retryable;
    };
    // best effort, empty details on unparsable bodies
    ProblemDetails parseProblemDetails(std::string_view body);

    // Accepts [...], {"books": [...]}, {"data": [...]} and {"data": {"books": [...]}}
    // throws Exception if none of these
    BookList parseResults(std::string_view body);
} // namespace shelfscan::scan
