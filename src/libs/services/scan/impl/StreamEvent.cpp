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

#include "services/scan/StreamEvent.hpp"

namespace shelfscan::scan
{
    namespace
    {
        template<class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
    } // namespace

    bool isTerminal(const StreamEvent& event)
    {
        return std::holds_alternative<event::Completed>(event)
               || std::holds_alternative<event::Failed>(event)
               || std::holds_alternative<event::Canceled>(event);
    }

    std::string_view getEventName(const StreamEvent& event)
    {
        return std::visit(overloaded{
                              [](const event::Progress&) -> std::string_view { return "progress"; },
                              [](const event::BookResult&) -> std::string_view { return "result"; },
                              [](const event::SegmentedPreview&) -> std::string_view { return "segmented"; },
                              [](const event::BookProgress&) -> std::string_view { return "book_progress"; },
                              [](const event::EnrichmentDegraded&) -> std::string_view { return "enrichment_degraded"; },
                              [](const event::Completed&) -> std::string_view { return "completed"; },
                              [](const event::Failed&) -> std::string_view { return "error"; },
                              [](const event::Canceled&) -> std::string_view { return "canceled"; },
                              [](const event::Ping&) -> std::string_view { return "ping"; },
                              [](const event::UnknownIgnorable& unknown) -> std::string_view { return unknown.name; },
                          },
                          event);
    }
} // namespace shelfscan::scan
