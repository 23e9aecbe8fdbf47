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

#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace shelfscan::scan
{
    struct SseRecord
    {
        std::string name; // "message" if no event field
        std::string data; // data lines joined with '\n'
    };

    // Incremental text/event-stream decoder
    // Records may span any number of chunks. Usage:
    //   decoder.feed(chunk);
    //   while (auto record{ decoder.next() })
    //       ...
    class SseDecoder
    {
    public:
        void feed(std::string_view chunk);
        std::optional<SseRecord> next();

        // drops any partial state, keeps the last event id
        void reset();

        // id of the last dispatched record, a record cut before its blank line does not count
        const std::optional<std::string>& getLastEventId() const { return _lastEventId; }

    private:
        void processLine(std::string_view line);
        void dispatch();

        std::string _pendingLine;
        std::string _eventName;
        std::string _data;
        bool _hasData{};
        std::optional<std::string> _pendingEventId;
        std::optional<std::string> _lastEventId;
        std::deque<SseRecord> _records;
    };
} // namespace shelfscan::scan
