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

#include "StreamClient.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

#include <boost/asio/steady_timer.hpp>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "services/scan/Exception.hpp"

#include "EventParser.hpp"
#include "ResponseParser.hpp"
#include "SseDecoder.hpp"

#define LOG(sev, message) SHELFSCAN_LOG(SCAN, sev, "[StreamClient] - " << message)

namespace shelfscan::scan
{
    namespace
    {
        constexpr std::string_view submitPath{ "/v3/jobs/scans" };
        constexpr std::size_t maxErrorBodySize{ 64 * 1024 };

        template<typename T>
        std::optional<T> headerReadAs(const Wt::Http::Message& msg, std::string_view headerName)
        {
            std::optional<T> res;

            if (const std::string * headerValue{ msg.getHeader(std::string{ headerName }) })
                res = core::stringUtils::readAs<T>(*headerValue);

            return res;
        }

        bool isSuccessStatus(int status)
        {
            return status >= 200 && status < 300;
        }

        std::string toDisplayString(const ProblemDetails& details, int status)
        {
            std::string res{ "HTTP " + std::to_string(status) };
            if (details.message)
                res += ": " + *details.message;

            return res;
        }

        Wt::Http::Message createSubmitMessage(const ScanJob& job)
        {
            const std::string boundary{ "ShelfScanBoundary-" + std::string{ core::UUID::generate().getAsString() } };
            const ImageData& imageData{ job.getImageData() };

            std::string body;
            body.reserve(imageData.size() + 512);
            body += "--" + boundary + "\r\n";
            body += "Content-Disposition: form-data; name=\"photos[]\"; filename=\"spine.jpg\"\r\n";
            body += "Content-Type: image/jpeg\r\n\r\n";
            body.append(reinterpret_cast<const char*>(imageData.data()), imageData.size());
            body += "\r\n--" + boundary + "--\r\n";

            Wt::Http::Message message;
            message.addHeader("Content-Type", "multipart/form-data; boundary=" + boundary);
            message.addHeader("Accept", "application/json");
            message.addHeader("X-Device-ID", job.getDeviceId());
            message.addBodyText(body);

            return message;
        }

        std::string getAuthorizationValue(const std::string& authToken)
        {
            return "Bearer " + authToken;
        }

        class HttpOperation final : public IOperation
        {
        public:
            HttpOperation(core::http::IClient& client, core::http::RequestId requestId, std::shared_ptr<std::atomic<bool>> canceled)
                : _client{ client }
                , _requestId{ requestId }
                , _canceled{ std::move(canceled) }
            {
            }
            ~HttpOperation() override { cancel(); }
            HttpOperation(const HttpOperation&) = delete;
            HttpOperation& operator=(const HttpOperation&) = delete;

            void cancel() override
            {
                if (!_canceled->exchange(true))
                    _client.abortRequest(_requestId);
            }

        private:
            core::http::IClient& _client;
            const core::http::RequestId _requestId;
            const std::shared_ptr<std::atomic<bool>> _canceled;
        };

        // Drives the stream of one job: (re)connections, decoding and dispatch
        class StreamSession : public std::enable_shared_from_this<StreamSession>
        {
        public:
            StreamSession(boost::asio::io_context& ioContext, core::http::IClient& client, const StreamClientSettings& settings, const StreamHandle& handle, std::size_t maxAttempts, IStreamClient::StreamCallbacks callbacks)
                : _client{ client }
                , _settings{ settings }
                , _handle{ handle }
                , _maxAttempts{ std::max<std::size_t>(maxAttempts, 1) }
                , _callbacks{ std::move(callbacks) }
                , _retryTimer{ ioContext }
                , _connectTimer{ ioContext }
            {
            }
            StreamSession(const StreamSession&) = delete;
            StreamSession& operator=(const StreamSession&) = delete;

            void start()
            {
                std::scoped_lock lock{ _mutex };
                connect();
            }

            void cancel()
            {
                std::optional<core::http::RequestId> requestId;
                {
                    std::scoped_lock lock{ _mutex };
                    if (_canceled)
                        return;

                    _canceled = true;
                    _state = State::Done;
                    requestId = std::exchange(_requestId, std::nullopt);
                    _retryTimer.cancel();
                    _connectTimer.cancel();
                }

                LOG(DEBUG, "Job " << _handle.jobId << ": stream canceled");
                if (requestId)
                    _client.abortRequest(*requestId);
            }

        private:
            enum class State
            {
                Connecting,
                Streaming,
                WaitingRetry,
                Done,
            };

            using ChunkReceivedResult = core::http::ClientRequestParameters::ChunkReceivedResult;

            // mutex must be held
            void connect()
            {
                _attempt++;
                _state = State::Connecting;
                _status = 0;
                _errorBody.clear();
                _decoder.reset();

                core::http::ClientGETRequestParameters params;
                params.url = _handle.streamUrl;
                params.timeout = _settings.streamIdleTimeout;
                params.headers.emplace_back("Accept", "text/event-stream");
                params.headers.emplace_back("Cache-Control", "no-cache");
                params.headers.emplace_back("X-Device-ID", _handle.deviceId);
                if (_handle.authToken)
                    params.headers.emplace_back("Authorization", getAuthorizationValue(*_handle.authToken));
                if (const std::optional<std::string>& lastEventId{ _decoder.getLastEventId() })
                    params.headers.emplace_back("Last-Event-ID", *lastEventId);

                const std::size_t attempt{ _attempt };
                auto self{ shared_from_this() };
                params.onHeadersReceived = [self, attempt](const Wt::Http::Message& msg) {
                    self->onHeadersReceived(attempt, msg);
                };
                params.onChunkReceived = [self, attempt](std::span<const std::byte> chunk) {
                    return self->onChunkReceived(attempt, chunk);
                };
                params.onResponseFunc = [self, attempt](const Wt::Http::Message& msg) {
                    self->onResponse(attempt, msg);
                };
                params.onFailureFunc = [self, attempt](std::string_view error) {
                    self->onConnectionFailure(attempt, error);
                };

                LOG(DEBUG, "Job " << _handle.jobId << ": opening stream, attempt " << _attempt << "/" << _maxAttempts);
                _requestId = _client.sendGETRequest(std::move(params));

                // the request timeout is the idle one, the headers must come sooner
                _connectTimer.expires_after(_settings.submitTimeout);
                _connectTimer.async_wait([self, attempt](const boost::system::error_code& ec) {
                    self->onConnectTimer(attempt, ec);
                });
            }

            // mutex must be held
            bool isCurrentAttempt(std::size_t attempt) const
            {
                return !_canceled && (_state == State::Connecting || _state == State::Streaming) && attempt == _attempt;
            }

            void onConnectTimer(std::size_t attempt, const boost::system::error_code& ec)
            {
                if (ec == boost::asio::error::operation_aborted)
                    return;
                else if (ec)
                    throw Exception{ "Connect timer failure: " + std::string{ ec.message() } };

                std::optional<core::http::RequestId> requestId;
                std::optional<std::string> failure;
                {
                    std::scoped_lock lock{ _mutex };
                    if (!isCurrentAttempt(attempt) || _state != State::Connecting)
                        return;

                    requestId = std::exchange(_requestId, std::nullopt);
                    failure = onAttemptFailed("connection timeout", true);
                }

                if (requestId)
                    _client.abortRequest(*requestId);
                if (failure)
                    notifyFailure(*failure);
            }

            void onHeadersReceived(std::size_t attempt, const Wt::Http::Message& msg)
            {
                std::scoped_lock lock{ _mutex };
                if (!isCurrentAttempt(attempt))
                    return;

                _connectTimer.cancel();
                _status = msg.status();
                if (isSuccessStatus(_status))
                    _state = State::Streaming;
            }

            ChunkReceivedResult onChunkReceived(std::size_t attempt, std::span<const std::byte> chunk)
            {
                std::vector<StreamEvent> events;
                bool terminal{};

                {
                    std::scoped_lock lock{ _mutex };
                    if (!isCurrentAttempt(attempt))
                        return ChunkReceivedResult::Abort;

                    _connectTimer.cancel();
                    const std::string_view data{ reinterpret_cast<const char*>(chunk.data()), chunk.size() };

                    // no status yet means the transport did not report the headers separately
                    if (_status != 0 && !isSuccessStatus(_status))
                    {
                        if (_errorBody.size() < maxErrorBodySize)
                            _errorBody.append(data.substr(0, maxErrorBodySize - _errorBody.size()));
                        return ChunkReceivedResult::Continue;
                    }

                    _decoder.feed(data);
                    while (std::optional<SseRecord> record{ _decoder.next() })
                    {
                        try
                        {
                            StreamEvent event{ parseEvent(record->name, record->data) };
                            if (const auto* unknown{ std::get_if<event::UnknownIgnorable>(&event) })
                            {
                                LOG(DEBUG, "Job " << _handle.jobId << ": ignoring unknown event '" << unknown->name << "'");
                                continue;
                            }

                            terminal = isTerminal(event);
                            events.push_back(std::move(event));
                            if (terminal)
                            {
                                _state = State::Done;
                                _requestId.reset();
                                break;
                            }
                        }
                        catch (const MalformedEventException& e)
                        {
                            LOG(WARNING, "Job " << _handle.jobId << ": skipping malformed event: " << e.what());
                        }
                    }
                }

                for (const StreamEvent& event : events)
                {
                    if (_canceled)
                        break;

                    LOG(DEBUG, "Job " << _handle.jobId << ": event '" << getEventName(event) << "'");
                    _callbacks.onEvent(event);
                }

                return terminal ? ChunkReceivedResult::Abort : ChunkReceivedResult::Continue;
            }

            void onResponse(std::size_t attempt, const Wt::Http::Message& msg)
            {
                std::optional<std::string> failure;
                {
                    std::scoped_lock lock{ _mutex };
                    if (!isCurrentAttempt(attempt))
                        return;

                    _requestId.reset();

                    const int status{ msg.status() };
                    if (isSuccessStatus(status))
                    {
                        failure = onAttemptFailed("stream closed before completion", true);
                    }
                    else
                    {
                        const ProblemDetails details{ parseProblemDetails(_errorBody.empty() ? msg.body() : _errorBody) };
                        const bool retryable{ status == 408 || status == 429 || status >= 500 };
                        failure = onAttemptFailed("stream rejected (" + toDisplayString(details, status) + ")", retryable);
                    }
                }

                if (failure)
                    notifyFailure(*failure);
            }

            void onConnectionFailure(std::size_t attempt, std::string_view error)
            {
                std::optional<std::string> failure;
                {
                    std::scoped_lock lock{ _mutex };
                    if (!isCurrentAttempt(attempt))
                        return;

                    _requestId.reset();
                    failure = onAttemptFailed("connection failure: " + std::string{ error }, true);
                }

                if (failure)
                    notifyFailure(*failure);
            }

            // mutex must be held
            // returns the final failure reason if the stream is given up
            std::optional<std::string> onAttemptFailed(const std::string& reason, bool retryable)
            {
                _connectTimer.cancel();

                if (!retryable)
                {
                    _state = State::Done;
                    return "Stream failed: " + reason;
                }

                if (_attempt >= _maxAttempts)
                {
                    _state = State::Done;
                    return "Stream failed after " + std::to_string(_attempt) + " attempts: " + reason;
                }

                const std::chrono::milliseconds delay{ computeRetryDelay(_settings.retryBaseDelay, _attempt) };
                LOG(INFO, "Job " << _handle.jobId << ": attempt " << _attempt << "/" << _maxAttempts << " failed (" << reason << "), retrying in " << delay.count() << " ms");

                _state = State::WaitingRetry;
                _retryTimer.expires_after(delay);
                _retryTimer.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
                    self->onRetryTimer(ec);
                });

                return std::nullopt;
            }

            void onRetryTimer(const boost::system::error_code& ec)
            {
                if (ec == boost::asio::error::operation_aborted)
                    return;
                else if (ec)
                    throw Exception{ "Retry timer failure: " + std::string{ ec.message() } };

                std::scoped_lock lock{ _mutex };
                if (_canceled || _state != State::WaitingRetry)
                    return;

                connect();
            }

            void notifyFailure(const std::string& reason)
            {
                if (_canceled)
                    return;

                LOG(WARNING, "Job " << _handle.jobId << ": " << reason);
                _callbacks.onFailure(reason);
            }

            core::http::IClient& _client;
            const StreamClientSettings _settings;
            const StreamHandle _handle;
            const std::size_t _maxAttempts;
            const IStreamClient::StreamCallbacks _callbacks;

            std::mutex _mutex;
            std::atomic<bool> _canceled{};
            State _state{ State::Connecting };
            std::size_t _attempt{};
            std::optional<core::http::RequestId> _requestId;
            int _status{};
            std::string _errorBody;
            SseDecoder _decoder;
            boost::asio::steady_timer _retryTimer;
            boost::asio::steady_timer _connectTimer;
        };

        class StreamOperation final : public IOperation
        {
        public:
            StreamOperation(std::shared_ptr<StreamSession> session)
                : _session{ std::move(session) }
            {
            }
            ~StreamOperation() override { cancel(); }
            StreamOperation(const StreamOperation&) = delete;
            StreamOperation& operator=(const StreamOperation&) = delete;

            void cancel() override { _session->cancel(); }

        private:
            const std::shared_ptr<StreamSession> _session;
        };
    } // namespace

    const char* getSubmitErrorTypeName(SubmitError::Type type)
    {
        switch (type)
        {
        case SubmitError::Type::RateLimited:
            return "RateLimited";
        case SubmitError::Type::ClientError:
            return "ClientError";
        case SubmitError::Type::ServerError:
            return "ServerError";
        case SubmitError::Type::ConnectionError:
            return "ConnectionError";
        case SubmitError::Type::InvalidResponse:
            return "InvalidResponse";
        }
        return "";
    }

    std::chrono::milliseconds computeRetryDelay(std::chrono::milliseconds baseDelay, std::size_t failedAttemptCount)
    {
        if (failedAttemptCount == 0)
            return std::chrono::milliseconds{ 0 };

        const std::size_t exponent{ std::min<std::size_t>(failedAttemptCount - 1, 16) };
        return baseDelay * (std::int64_t{ 1 } << exponent);
    }

    SubmitOutcome classifySubmitResponse(const Wt::Http::Message& response, std::chrono::seconds defaultRetryAfter)
    {
        const int status{ response.status() };

        if (isSuccessStatus(status))
        {
            if (std::optional<SubmitResponse> submitResponse{ parseSubmitResponse(response.body()) })
                return std::move(*submitResponse);

            return SubmitError{
                .type = SubmitError::Type::InvalidResponse,
                .message = "Invalid submit response (HTTP " + std::to_string(status) + ")",
                .httpStatus = status,
            };
        }

        const ProblemDetails details{ parseProblemDetails(response.body()) };

        if (status == 429)
        {
            const std::chrono::seconds retryAfter{ headerReadAs<std::chrono::seconds>(response, "Retry-After").value_or(defaultRetryAfter) };
            return SubmitError{
                .type = SubmitError::Type::RateLimited,
                .message = "Rate limited, retry in " + std::to_string(retryAfter.count()) + " seconds",
                .code = details.code,
                .httpStatus = status,
                .retryable = true,
                .retryAfter = retryAfter,
            };
        }

        if (status >= 400 && status < 500)
        {
            return SubmitError{
                .type = SubmitError::Type::ClientError,
                .message = "Scan rejected (" + toDisplayString(details, status) + ")",
                .code = details.code,
                .httpStatus = status,
                .retryable = false,
            };
        }

        return SubmitError{
            .type = SubmitError::Type::ServerError,
            .message = "Server error (" + toDisplayString(details, status) + ")",
            .code = details.code,
            .httpStatus = status,
            .retryable = details.retryable.value_or(true),
        };
    }

    StreamClient::StreamClient(boost::asio::io_context& ioContext, std::unique_ptr<core::http::IClient> httpClient, const StreamClientSettings& settings)
        : _ioContext{ ioContext }
        , _httpClient{ std::move(httpClient) }
        , _settings{ settings }
    {
    }

    StreamClient::~StreamClient()
    {
        _httpClient->abortAllRequests();
    }

    std::unique_ptr<IOperation> StreamClient::submit(const ScanJob& job, SubmitCallback callback)
    {
        auto canceled{ std::make_shared<std::atomic<bool>>(false) };

        core::http::ClientPOSTRequestParameters params;
        params.url = std::string{ submitPath };
        params.timeout = _settings.submitTimeout;
        params.message = createSubmitMessage(job);
        params.onResponseFunc = [callback, canceled, defaultRetryAfter = _settings.defaultRetryAfter](const Wt::Http::Message& msg) {
            if (*canceled)
                return;

            callback(classifySubmitResponse(msg, defaultRetryAfter));
        };
        params.onFailureFunc = [callback, canceled](std::string_view error) {
            if (*canceled)
                return;

            callback(SubmitError{
                .type = SubmitError::Type::ConnectionError,
                .message = "Connection failure: " + std::string{ error },
                .retryable = true,
            });
        };

        LOG(DEBUG, "Submitting job " << job.getLocalId().getAsString() << ", image size = " << job.getImageData().size());
        const core::http::RequestId requestId{ _httpClient->sendPOSTRequest(std::move(params)) };

        return std::make_unique<HttpOperation>(*_httpClient, requestId, std::move(canceled));
    }

    std::unique_ptr<IOperation> StreamClient::consumeStream(const StreamHandle& handle, std::size_t maxAttempts, StreamCallbacks callbacks)
    {
        auto session{ std::make_shared<StreamSession>(_ioContext, *_httpClient, _settings, handle, maxAttempts, std::move(callbacks)) };
        session->start();

        return std::make_unique<StreamOperation>(std::move(session));
    }

    std::unique_ptr<IOperation> StreamClient::fetchResults(const std::string& resultsUrl, const std::optional<std::string>& authToken, ResultsCallback callback)
    {
        auto canceled{ std::make_shared<std::atomic<bool>>(false) };

        core::http::ClientGETRequestParameters params;
        params.url = resultsUrl;
        params.timeout = _settings.submitTimeout;
        params.headers.emplace_back("Accept", "application/json");
        if (authToken)
            params.headers.emplace_back("Authorization", getAuthorizationValue(*authToken));

        params.onResponseFunc = [callback, canceled](const Wt::Http::Message& msg) {
            if (*canceled)
                return;

            if (!isSuccessStatus(msg.status()))
            {
                callback("Cannot fetch results (" + toDisplayString(parseProblemDetails(msg.body()), msg.status()) + ")");
                return;
            }

            std::variant<BookList, std::string> result;
            try
            {
                result = parseResults(msg.body());
            }
            catch (const Exception& e)
            {
                result = std::string{ "Cannot fetch results: " } + e.what();
            }
            callback(std::move(result));
        };
        params.onFailureFunc = [callback, canceled](std::string_view error) {
            if (*canceled)
                return;

            callback("Cannot fetch results: " + std::string{ error });
        };

        LOG(DEBUG, "Fetching results from '" << resultsUrl << "'");
        const core::http::RequestId requestId{ _httpClient->sendGETRequest(std::move(params)) };

        return std::make_unique<HttpOperation>(*_httpClient, requestId, std::move(canceled));
    }

    void StreamClient::cleanup(const std::string& jobId, const std::optional<std::string>& authToken)
    {
        core::http::ClientDELETERequestParameters params;
        params.url = std::string{ submitPath } + "/" + jobId + "/cleanup";
        params.timeout = _settings.submitTimeout;
        if (authToken)
            params.message.addHeader("Authorization", getAuthorizationValue(*authToken));

        params.onResponseFunc = [jobId](const Wt::Http::Message& msg) {
            // 404: already cleaned up
            if (msg.status() == 200 || msg.status() == 204 || msg.status() == 404)
                LOG(DEBUG, "Job " << jobId << ": cleanup done, status = " << msg.status());
            else
                LOG(WARNING, "Job " << jobId << ": cleanup failed, status = " << msg.status());
        };
        params.onFailureFunc = [jobId](std::string_view error) {
            LOG(WARNING, "Job " << jobId << ": cleanup failed: " << error);
        };

        LOG(DEBUG, "Job " << jobId << ": requesting cleanup");
        _httpClient->sendDELETERequest(std::move(params));
    }
} // namespace shelfscan::scan
