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

#include <chrono>
#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Http/Message.h>

namespace shelfscan::core::http
{
    struct ClientRequestParameters
    {
        std::string url;                                          // absolute, or relative to the baseUrl used by the client
        std::chrono::steady_clock::duration timeout{ std::chrono::seconds{ 30 } }; // connection and I/O inactivity timeout
        std::size_t responseBufferSize{ 10 * 1024 * 1024 };       // only used if onChunkReceived is not set

        // Called once the status line and headers are received
        using OnHeadersReceived = std::function<void(const Wt::Http::Message& msg)>;
        OnHeadersReceived onHeadersReceived;

        // If `onChunkReceived` is set, the response will be streamed in chunks.
        // In that case, `onResponseFunc` is still called at the end (with an empty msgBody).
        // If `onChunkReceived` is not set, the response will be fully buffered and passed to `onResponseFunc`.
        enum class ChunkReceivedResult
        {
            Continue,
            Abort, // onAbortFunc will be called
        };
        using OnChunkReceived = std::function<ChunkReceivedResult(std::span<const std::byte> chunk)>;
        OnChunkReceived onChunkReceived;

        // Called whatever the HTTP status is
        using OnResponseFunc = std::function<void(const Wt::Http::Message& msg)>;
        OnResponseFunc onResponseFunc;

        // Transport level failure (bad url, connection refused, timeout, ...)
        using OnFailureFunc = std::function<void(std::string_view error)>;
        OnFailureFunc onFailureFunc;

        using OnAbortFunc = std::function<void()>;
        OnAbortFunc onAbortFunc;
    };

    struct ClientGETRequestParameters final : public ClientRequestParameters
    {
        std::vector<Wt::Http::Message::Header> headers;
    };

    struct ClientPOSTRequestParameters final : public ClientRequestParameters
    {
        Wt::Http::Message message;
    };

    struct ClientDELETERequestParameters final : public ClientRequestParameters
    {
        Wt::Http::Message message;
    };
} // namespace shelfscan::core::http
