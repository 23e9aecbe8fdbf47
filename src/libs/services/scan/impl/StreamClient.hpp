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
#include <memory>

#include <boost/asio/io_context.hpp>

#include <Wt/Http/Message.h>

#include "core/http/IClient.hpp"
#include "IStreamClient.hpp"

namespace shelfscan::scan
{
    struct StreamClientSettings
    {
        std::chrono::milliseconds submitTimeout{ std::chrono::seconds{ 30 } }; // also the stream connection timeout
        std::chrono::seconds streamIdleTimeout{ 90 }; // must be greater than the server ping period
        std::chrono::milliseconds retryBaseDelay{ std::chrono::seconds{ 2 } };
        std::chrono::seconds defaultRetryAfter{ 60 };
    };

    // Delay before the next attempt, after `failedAttemptCount` failed attempts: base, 2 * base, 4 * base, ...
    std::chrono::milliseconds computeRetryDelay(std::chrono::milliseconds baseDelay, std::size_t failedAttemptCount);

    // Maps a submit HTTP response to its outcome
    SubmitOutcome classifySubmitResponse(const Wt::Http::Message& response, std::chrono::seconds defaultRetryAfter);

    class StreamClient final : public IStreamClient
    {
    public:
        StreamClient(boost::asio::io_context& ioContext, std::unique_ptr<core::http::IClient> httpClient, const StreamClientSettings& settings);
        ~StreamClient() override;
        StreamClient(const StreamClient&) = delete;
        StreamClient& operator=(const StreamClient&) = delete;

    private:
        std::unique_ptr<IOperation> submit(const ScanJob& job, SubmitCallback callback) override;
        std::unique_ptr<IOperation> consumeStream(const StreamHandle& handle, std::size_t maxAttempts, StreamCallbacks callbacks) override;
        std::unique_ptr<IOperation> fetchResults(const std::string& resultsUrl, const std::optional<std::string>& authToken, ResultsCallback callback) override;
        void cleanup(const std::string& jobId, const std::optional<std::string>& authToken) override;

        boost::asio::io_context& _ioContext;
        const std::unique_ptr<core::http::IClient> _httpClient;
        const StreamClientSettings _settings;
    };
} // namespace shelfscan::scan
