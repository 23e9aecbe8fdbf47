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

#include "Client.hpp"

#include <cassert>
#include <latch>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>

#include "core/ILogger.hpp"

#define LOG(sev, message) SHELFSCAN_LOG(HTTP, sev, "[Http Client] - " << message)

namespace shelfscan::core::http
{
    std::unique_ptr<IClient> createClient(boost::asio::io_context& ioContext, std::string_view baseUrl)
    {
        return std::make_unique<Client>(ioContext, baseUrl);
    }

    Client::Client(boost::asio::io_context& ioContext, std::string_view baseUrl)
        : _ioContext{ ioContext }
        , _baseUrl{ baseUrl }
    {
    }

    Client::~Client()
    {
        abortAllRequests();
    }

    RequestId Client::sendGETRequest(ClientGETRequestParameters&& GETParams)
    {
        return sendRequest(std::make_unique<ClientRequest>(std::move(GETParams)));
    }

    RequestId Client::sendPOSTRequest(ClientPOSTRequestParameters&& POSTParams)
    {
        return sendRequest(std::make_unique<ClientRequest>(std::move(POSTParams)));
    }

    RequestId Client::sendDELETERequest(ClientDELETERequestParameters&& DELETEParams)
    {
        return sendRequest(std::make_unique<ClientRequest>(std::move(DELETEParams)));
    }

    void Client::abortRequest(RequestId requestId)
    {
        boost::asio::post(_strand, [this, requestId] {
            auto it{ _pendingRequests.find(requestId) };
            if (it == std::end(_pendingRequests))
                return;

            LOG(DEBUG, "Aborting request " << requestId);

            // destroying the Wt client cancels the connection and disconnects its signals
            std::unique_ptr<ClientRequest> request{ std::move(it->second.request) };
            _pendingRequests.erase(it);

            if (request->getParameters().onAbortFunc)
                request->getParameters().onAbortFunc();
        });
    }

    void Client::abortAllRequests()
    {
        LOG(DEBUG, "Aborting all requests...");

        if (_ioContext.stopped())
        {
            _pendingRequests.clear();
            LOG(DEBUG, "IO context stopped, requests discarded");
            return;
        }

        _abortAllRequests = true;

        std::latch abortLatch{ 1 };
        boost::asio::post(_strand, [this, &abortLatch] {
            abortPendingRequests();
            abortLatch.count_down();
        });
        abortLatch.wait();

        _abortAllRequests = false;

        LOG(DEBUG, "All requests aborted!");
    }

    void Client::abortPendingRequests()
    {
        assert(_strand.running_in_this_thread());

        auto pendingRequests{ std::move(_pendingRequests) };
        _pendingRequests.clear();

        for (auto& [requestId, pendingRequest] : pendingRequests)
        {
            pendingRequest.client.reset();
            if (pendingRequest.request->getParameters().onAbortFunc)
                pendingRequest.request->getParameters().onAbortFunc();
        }
    }

    RequestId Client::sendRequest(std::unique_ptr<ClientRequest> request)
    {
        const RequestId requestId{ _nextRequestId++ };

        boost::asio::post(_strand, [this, requestId, request = std::move(request)]() mutable {
            if (_abortAllRequests)
            {
                LOG(DEBUG, "Not sending request because abortAllRequests() in progress");
                if (request->getParameters().onAbortFunc)
                    request->getParameters().onAbortFunc();

                return;
            }

            auto client{ std::make_unique<Wt::Http::Client>(_ioContext) };
            client->setFollowRedirect(true);
            client->setTimeout(request->getParameters().timeout);
            client->setMaximumResponseSize(request->getParameters().onChunkReceived ? 0 : request->getParameters().responseBufferSize);

            // not very efficient (response bodies are copied for each callback), but Wt's code already makes copies anyway
            client->headersReceived().connect([this, requestId](const Wt::Http::Message& msg) {
                boost::asio::post(boost::asio::bind_executor(_strand, [this, requestId, msg] {
                    onClientHeadersReceived(requestId, msg);
                }));
            });

            client->bodyDataReceived().connect([this, requestId](const std::string& data) {
                boost::asio::post(boost::asio::bind_executor(_strand, [this, requestId, data] {
                    onClientBodyDataReceived(requestId, data);
                }));
            });

            client->done().connect([this, requestId](Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg) {
                boost::asio::post(boost::asio::bind_executor(_strand, [this, requestId, ec, msg] {
                    onClientDone(requestId, ec, msg);
                }));
            });

            if (!sendRequest(requestId, *request, *client))
            {
                if (request->getParameters().onFailureFunc)
                    request->getParameters().onFailureFunc("bad url or unsupported scheme");
                return;
            }

            _pendingRequests.emplace(requestId, PendingRequest{ std::move(request), std::move(client) });
        });

        return requestId;
    }

    bool Client::sendRequest(RequestId requestId, const ClientRequest& request, Wt::Http::Client& client)
    {
        assert(_strand.running_in_this_thread());

        const std::string url{ buildUrl(request.getParameters().url) };
        LOG(DEBUG, "Sending " << getTypeName(request.getType()) << " request " << requestId << " to url '" << url << "'");

        bool res{};
        switch (request.getType())
        {
        case ClientRequest::Type::GET:
            res = client.get(url, request.getGETParameters().headers);
            break;

        case ClientRequest::Type::POST:
            res = client.post(url, request.getPOSTParameters().message);
            break;

        case ClientRequest::Type::DELETE:
            res = client.deleteRequest(url, request.getDELETEParameters().message);
            break;
        }

        if (!res)
            LOG(ERROR, "Send failed, bad url or unsupported scheme? url = '" << url << "'");

        return res;
    }

    std::string Client::buildUrl(std::string_view url) const
    {
        if (url.starts_with("http://") || url.starts_with("https://"))
            return std::string{ url };

        return _baseUrl + std::string{ url };
    }

    void Client::onClientHeadersReceived(RequestId requestId, const Wt::Http::Message& msg)
    {
        assert(_strand.running_in_this_thread());

        auto it{ _pendingRequests.find(requestId) };
        if (it == std::end(_pendingRequests))
            return;

        LOG(DEBUG, "Headers received for request " << requestId << ", status = " << msg.status());

        if (it->second.request->getParameters().onHeadersReceived)
            it->second.request->getParameters().onHeadersReceived(msg);
    }

    void Client::onClientBodyDataReceived(RequestId requestId, const std::string& data)
    {
        assert(_strand.running_in_this_thread());

        auto it{ _pendingRequests.find(requestId) };
        if (it == std::end(_pendingRequests))
            return;

        const ClientRequestParameters& parameters{ it->second.request->getParameters() };
        if (!parameters.onChunkReceived)
            return;

        const auto byteSpan{ std::as_bytes(std::span{ data.data(), data.size() }) };
        if (parameters.onChunkReceived(byteSpan) == ClientRequestParameters::ChunkReceivedResult::Abort)
        {
            LOG(DEBUG, "Request " << requestId << " aborted by receiver");

            std::unique_ptr<ClientRequest> request{ std::move(it->second.request) };
            _pendingRequests.erase(it);

            if (request->getParameters().onAbortFunc)
                request->getParameters().onAbortFunc();
        }
    }

    void Client::onClientDone(RequestId requestId, Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg)
    {
        assert(_strand.running_in_this_thread());

        auto it{ _pendingRequests.find(requestId) };
        if (it == std::end(_pendingRequests))
            return; // already aborted

        LOG(DEBUG, "Request " << requestId << " done. ec = " << ec.category().name() << " - " << ec.message() << " (" << ec.value() << "), status = " << msg.status());

        std::unique_ptr<ClientRequest> request{ std::move(it->second.request) };
        _pendingRequests.erase(it);

        const ClientRequestParameters& parameters{ request->getParameters() };
        if (ec == boost::asio::error::operation_aborted)
        {
            if (parameters.onAbortFunc)
                parameters.onAbortFunc();
        }
        else if (ec && (ec != boost::asio::ssl::error::stream_truncated))
        {
            LOG(WARNING, "Request " << requestId << " failed: '" << ec.message() << "'");
            if (parameters.onFailureFunc)
                parameters.onFailureFunc(ec.message());
        }
        else
        {
            if (parameters.onResponseFunc)
                parameters.onResponseFunc(msg);
        }
    }
} // namespace shelfscan::core::http
