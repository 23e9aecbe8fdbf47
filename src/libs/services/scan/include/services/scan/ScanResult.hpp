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
#include <variant>

#include "core/UUID.hpp"
#include "services/scan/BookMetadata.hpp"

namespace shelfscan::scan
{
    struct ScanFailure
    {
        std::string reason; // human readable, specific to the failure
        std::optional<std::string> code;
        bool retryable{};
    };

    // Terminal outcome of one capture
    struct ScanResult
    {
        core::UUID localId;
        std::optional<std::string> jobId;
        std::variant<BookList, ScanFailure> outcome;

        bool isSuccess() const { return std::holds_alternative<BookList>(outcome); }
        const BookList& getBooks() const { return std::get<BookList>(outcome); }
        const ScanFailure& getFailure() const { return std::get<ScanFailure>(outcome); }
    };
} // namespace shelfscan::scan
