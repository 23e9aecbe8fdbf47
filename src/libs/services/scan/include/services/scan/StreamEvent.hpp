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

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "services/scan/BookMetadata.hpp"

namespace shelfscan::scan
{
    namespace event
    {
        struct Progress
        {
            std::string message;
        };

        struct BookResult
        {
            BookMetadata book;
        };

        struct SegmentedPreview
        {
            std::vector<std::byte> previewImage; // decoded, usually jpeg
            std::size_t totalDetected{};
        };

        struct BookProgress
        {
            std::size_t currentIndex{};
            std::size_t totalCount{};
            std::optional<std::string> stage;
        };

        // Metadata enrichment fell back to a secondary source
        struct EnrichmentDegraded
        {
            std::optional<std::string> reason;
            std::optional<std::string> isbn;
            std::optional<std::string> title;
            std::optional<std::string> fallbackSource;
        };

        struct Completed
        {
            std::optional<std::string> resultsUrl;
            std::optional<BookList> inlineBooks;
        };

        struct Failed
        {
            std::string message;
            std::optional<std::string> code;
            bool retryable{};
        };

        struct Canceled
        {
        };

        struct Ping
        {
        };

        struct UnknownIgnorable
        {
            std::string name;
        };
    } // namespace event

    using StreamEvent = std::variant<event::Progress,
        event::BookResult,
        event::SegmentedPreview,
        event::BookProgress,
        event::EnrichmentDegraded,
        event::Completed,
        event::Failed,
        event::Canceled,
        event::Ping,
        event::UnknownIgnorable>;

    // Completed, Failed or Canceled
    bool isTerminal(const StreamEvent& event);
    std::string_view getEventName(const StreamEvent& event);
} // namespace shelfscan::scan
