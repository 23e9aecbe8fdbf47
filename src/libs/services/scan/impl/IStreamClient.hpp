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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "services/scan/ScanJob.hpp"
#include "services/scan/StreamEvent.hpp"

namespace shelfscan::scan
{
    struct SubmitResponse
    {
        std::string jobId;
        std::string streamUrl;
        std::optional<std::string> authToken;
        std::optional<std::string> statusUrl;
    };

    struct SubmitError
    {
        enum class Type
        {
            RateLimited,     // 429, not retried locally
            ClientError,     // other 4xx, not retryable
            ServerError,     // 5xx, retryable
            ConnectionError, // transport failure, retryable
            InvalidResponse, // 2xx without a usable body
        };

        Type type;
        std::string message;
        std::optional<std::string> code;
        std::optional<int> httpStatus;
        bool retryable{};                  // worth submitting again later
        std::chrono::seconds retryAfter{}; // only for RateLimited
    };
    const char* getSubmitErrorTypeName(SubmitError::Type type);

    using SubmitOutcome = std::variant<SubmitResponse, SubmitError>;

    struct StreamHandle
    {
        std::string jobId;
        std::string streamUrl;
        std::optional<std::string> authToken;
        std::string deviceId;
    };

    // Handle on an asynchronous call, cancel() is idempotent and does not block
    // No callback is called once cancel() has returned, except the ones already running
    class IOperation
    {
    public:
        virtual ~IOperation() = default;
        virtual void cancel() = 0;
    };

    class IStreamClient
    {
    public:
        virtual ~IStreamClient() = default;

        using SubmitCallback = std::function<void(SubmitOutcome outcome)>;
        virtual std::unique_ptr<IOperation> submit(const ScanJob& job, SubmitCallback callback) = 0;

        // onEvent is called in arrival order, the last call carries the terminal event
        // onFailure is called instead if the connection cannot be (re)established
        // or was dropped too many times before a terminal event
        struct StreamCallbacks
        {
            std::function<void(const StreamEvent& event)> onEvent;
            std::function<void(const std::string& reason)> onFailure;
        };
        virtual std::unique_ptr<IOperation> consumeStream(const StreamHandle& handle, std::size_t maxAttempts, StreamCallbacks callbacks) = 0;

        using ResultsCallback = std::function<void(std::variant<BookList, std::string /* error */> result)>;
        virtual std::unique_ptr<IOperation> fetchResults(const std::string& resultsUrl, const std::optional<std::string>& authToken, ResultsCallback callback) = 0;

        // fire and forget, failures are only logged
        virtual void cleanup(const std::string& jobId, const std::optional<std::string>& authToken) = 0;
    };
} // namespace shelfscan::scan
