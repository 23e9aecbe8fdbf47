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

#include <cstdint>
#include <memory>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "core/http/ClientRequestParameters.hpp"

namespace shelfscan::core::http
{
    using RequestId = std::uint64_t;

    // Requests are processed concurrently
    // Callbacks are never called from within the send/abort calls
    class IClient
    {
    public:
        virtual ~IClient() = default;

        virtual RequestId sendGETRequest(ClientGETRequestParameters&& request) = 0;
        virtual RequestId sendPOSTRequest(ClientPOSTRequestParameters&& request) = 0;
        virtual RequestId sendDELETERequest(ClientDELETERequestParameters&& request) = 0;

        // asynchronous, onAbortFunc is called if the request was still in progress
        virtual void abortRequest(RequestId requestId) = 0;
        // blocks until all requests are aborted
        virtual void abortAllRequests() = 0;
    };

    std::unique_ptr<IClient> createClient(boost::asio::io_context& ioContext, std::string_view baseUrl);
} // namespace shelfscan::core::http
