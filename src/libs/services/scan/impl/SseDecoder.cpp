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

#include "SseDecoder.hpp"

namespace shelfscan::scan
{
    void SseDecoder::feed(std::string_view chunk)
    {
        _pendingLine.append(chunk);

        std::size_t lineStart{};
        for (std::size_t pos{ _pendingLine.find('\n') }; pos != std::string::npos; pos = _pendingLine.find('\n', lineStart))
        {
            std::string_view line{ std::string_view{ _pendingLine }.substr(lineStart, pos - lineStart) };
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);

            processLine(line);
            lineStart = pos + 1;
        }

        _pendingLine.erase(0, lineStart);
    }

    std::optional<SseRecord> SseDecoder::next()
    {
        if (_records.empty())
            return std::nullopt;

        SseRecord record{ std::move(_records.front()) };
        _records.pop_front();

        return record;
    }

    void SseDecoder::reset()
    {
        _pendingLine.clear();
        _eventName.clear();
        _data.clear();
        _hasData = false;
        _pendingEventId.reset();
        _records.clear();
    }

    void SseDecoder::processLine(std::string_view line)
    {
        if (line.empty())
        {
            dispatch();
            return;
        }

        if (line.front() == ':') // comment, often used as keep-alive
            return;

        std::string_view field{ line };
        std::string_view value;
        if (const std::size_t colonPos{ line.find(':') }; colonPos != std::string_view::npos)
        {
            field = line.substr(0, colonPos);
            value = line.substr(colonPos + 1);
            if (!value.empty() && value.front() == ' ')
                value.remove_prefix(1);
        }

        if (field == "event")
        {
            _eventName = value;
        }
        else if (field == "data")
        {
            if (_hasData)
                _data += '\n';
            _data += value;
            _hasData = true;
        }
        else if (field == "id")
        {
            _pendingEventId = std::string{ value };
        }
        // "retry" and unknown fields are ignored
    }

    void SseDecoder::dispatch()
    {
        if (_pendingEventId)
            _lastEventId = std::move(_pendingEventId);
        _pendingEventId.reset();

        if (_hasData || !_eventName.empty())
            _records.push_back(SseRecord{ _eventName.empty() ? "message" : std::move(_eventName), std::move(_data) });

        _eventName.clear();
        _data.clear();
        _hasData = false;
    }
} // namespace shelfscan::scan
