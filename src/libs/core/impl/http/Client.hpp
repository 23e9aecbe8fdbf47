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

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>

#include <Wt/Http/Client.h>

#include "core/http/IClient.hpp"
#include "ClientRequest.hpp"

namespace shelfscan::core::http
{
    class Client final : public IClient
    {
    public:
        Client(boost::asio::io_context& ioContext, std::string_view baseUrl);
        ~Client() override;

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;
        Client(Client&&) = delete;
        Client& operator=(Client&&) = delete;

    private:
        RequestId sendGETRequest(ClientGETRequestParameters&& request) override;
        RequestId sendPOSTRequest(ClientPOSTRequestParameters&& request) override;
        RequestId sendDELETERequest(ClientDELETERequestParameters&& request) override;
        void abortRequest(RequestId requestId) override;
        void abortAllRequests() override;

        RequestId sendRequest(std::unique_ptr<ClientRequest> request);
        bool sendRequest(RequestId requestId, const ClientRequest& request, Wt::Http::Client& client);
        std::string buildUrl(std::string_view url) const;

        void onClientHeadersReceived(RequestId requestId, const Wt::Http::Message& msg);
        void onClientBodyDataReceived(RequestId requestId, const std::string& data);
        void onClientDone(RequestId requestId, Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg);

        // one Wt client per request in progress, only accessed from the strand
        struct PendingRequest
        {
            std::unique_ptr<ClientRequest> request;
            std::unique_ptr<Wt::Http::Client> client;
        };
        void abortPendingRequests();

        boost::asio::io_context& _ioContext;
        boost::asio::io_context::strand _strand{ _ioContext };
        const std::string _baseUrl;
        std::atomic<RequestId> _nextRequestId{ 1 };
        std::atomic<bool> _abortAllRequests{};
        std::unordered_map<RequestId, PendingRequest> _pendingRequests;
    };
} // namespace shelfscan::core::http
