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

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include <gtest/gtest.h>

#include "core/IOContextRunner.hpp"

#include "ScanService.hpp"
#include "StreamClient.hpp"

#include "FakeHttpClient.hpp"

namespace shelfscan::scan::tests
{
    namespace
    {
        using namespace std::chrono_literals;
        using Method = FakeHttpClient::Method;

        std::string submitResponseBody(std::string_view jobId)
        {
            return R"({"success":true,"data":{"jobId":")" + std::string{ jobId } + R"(","sseUrl":"/v3/jobs/scans/)" + std::string{ jobId } + R"(/stream","authToken":"token-)" + std::string{ jobId } + R"("}})";
        }

        std::string sseEvent(std::string_view name, std::string_view data)
        {
            return "event: " + std::string{ name } + "\ndata: " + std::string{ data } + "\n\n";
        }

        ImageData createImage(std::string_view content)
        {
            ImageData image;
            for (char c : content)
                image.push_back(std::byte{ static_cast<unsigned char>(c) });
            return image;
        }

        class Observer final : public IScanObserver
        {
        public:
            void onTerminalResult(const ScanResult& result) override
            {
                {
                    std::scoped_lock lock{ _mutex };
                    _results.push_back(result);
                }
                _cv.notify_all();
            }

            void onIntermediateEvent(const core::UUID& /*localId*/, const StreamEvent& event) override
            {
                {
                    std::scoped_lock lock{ _mutex };
                    _intermediateEvents.push_back(event);
                }
                _cv.notify_all();
            }

            void onDeferred(const core::UUID& localId, DeferReason reason) override
            {
                {
                    std::scoped_lock lock{ _mutex };
                    _deferred.emplace_back(localId, reason);
                }
                _cv.notify_all();
            }

            bool waitForResults(std::size_t count)
            {
                std::unique_lock lock{ _mutex };
                return _cv.wait_for(lock, 5s, [&] { return _results.size() >= count; });
            }

            bool waitForDeferred(std::size_t count)
            {
                std::unique_lock lock{ _mutex };
                return _cv.wait_for(lock, 5s, [&] { return _deferred.size() >= count; });
            }

            std::vector<ScanResult> getResults() const
            {
                std::scoped_lock lock{ _mutex };
                return _results;
            }

            std::vector<std::pair<core::UUID, DeferReason>> getDeferred() const
            {
                std::scoped_lock lock{ _mutex };
                return _deferred;
            }

            std::size_t getIntermediateEventCount() const
            {
                std::scoped_lock lock{ _mutex };
                return _intermediateEvents.size();
            }

        private:
            mutable std::mutex _mutex;
            std::condition_variable _cv;
            std::vector<ScanResult> _results;
            std::vector<StreamEvent> _intermediateEvents;
            std::vector<std::pair<core::UUID, DeferReason>> _deferred;
        };

        bool waitUntil(const std::function<bool()>& predicate)
        {
            const auto deadline{ std::chrono::steady_clock::now() + 5s };
            while (!predicate())
            {
                if (std::chrono::steady_clock::now() > deadline)
                    return false;
                std::this_thread::sleep_for(5ms);
            }
            return true;
        }

        class ScanServiceTest : public ::testing::Test
        {
        protected:
            void SetUp() override
            {
                _queueDirectory = std::filesystem::temp_directory_path() / ("shelfscan-service-" + std::string{ core::UUID::generate().getAsString() });
            }

            void TearDown() override
            {
                _service.reset();

                std::error_code ec;
                std::filesystem::remove_all(_queueDirectory, ec);
            }

            void createService()
            {
                auto httpClient{ std::make_unique<FakeHttpClient>(_ioContext) };
                _httpClient = httpClient.get();

                StreamClientSettings clientSettings;
                clientSettings.retryBaseDelay = 10ms;

                ScanServiceSettings settings;
                settings.deviceId = "device-1";

                _service = std::make_unique<ScanService>(_ioContext,
                    _observer,
                    settings,
                    std::make_unique<StreamClient>(_ioContext, std::move(httpClient), clientSettings),
                    createCooldownTracker(),
                    createDurableQueue(_queueDirectory));
            }

            IScanService& service() { return *_service; }

            std::size_t getRequestCount(Method method) const { return _httpClient->getSentRequests(method).size(); }

            Observer _observer;
            boost::asio::io_context _ioContext;
            core::IOContextRunner _ioContextRunner{ _ioContext, 1, "Test" };
            std::filesystem::path _queueDirectory;
            FakeHttpClient* _httpClient{};
            std::unique_ptr<IScanService> _service;
        };
    } // namespace

    TEST_F(ScanServiceTest, captureWithInlineResults)
    {
        createService();

        _httpClient->pushResponse(Method::POST, { .status = 202, .body = submitResponseBody("J1") });
        _httpClient->pushResponse(Method::GET, { .chunks = {
                                                     sseEvent("progress", R"({"message":"Detecting spines"})"),
                                                     sseEvent("progress", R"({"message":"Reading titles"})"),
                                                     sseEvent("completed", R"({"books":[{"title":"Dune","author":"Frank Herbert"},{"title":"Emma","author":"Jane Austen"}]})")
                                                         + sseEvent("completed", R"({"books":[]})"),
                                                 } });

        const core::UUID localId{ service().handleCapture(createImage("spines")) };

        ASSERT_TRUE(_observer.waitForResults(1));
        ASSERT_TRUE(waitUntil([&] { return getRequestCount(Method::DELETE) == 1; }));
        std::this_thread::sleep_for(50ms);

        const std::vector<ScanResult> results{ _observer.getResults() };
        ASSERT_EQ(results.size(), 1);
        EXPECT_EQ(results[0].localId, localId);
        ASSERT_TRUE(results[0].jobId.has_value());
        EXPECT_EQ(*results[0].jobId, "J1");
        ASSERT_TRUE(results[0].isSuccess());
        ASSERT_EQ(results[0].getBooks().size(), 2);
        EXPECT_EQ(results[0].getBooks()[0].title, "Dune");
        EXPECT_EQ(results[0].getBooks()[1].author, "Jane Austen");
        EXPECT_EQ(_observer.getIntermediateEventCount(), 2);

        const std::vector<FakeHttpClient::SentRequest> cleanups{ _httpClient->getSentRequests(Method::DELETE) };
        ASSERT_EQ(cleanups.size(), 1);
        EXPECT_EQ(cleanups[0].url, "/v3/jobs/scans/J1/cleanup");

        const ScanStatus status{ service().getStatus() };
        EXPECT_EQ(status.activeCount, 0);
        EXPECT_EQ(status.queuedCount, 0);
        EXPECT_FALSE(status.cooldownActive);
    }

    TEST_F(ScanServiceTest, rateLimited)
    {
        createService();

        _httpClient->pushResponse(Method::POST, { .status = 429, .headers = { { "Retry-After", "30" } } });

        const core::UUID localId{ service().handleCapture(createImage("spines")) };

        ASSERT_TRUE(_observer.waitForDeferred(1));
        {
            const auto deferred{ _observer.getDeferred() };
            EXPECT_EQ(deferred[0].first, localId);
            EXPECT_EQ(deferred[0].second, DeferReason::RateLimited);
        }

        ScanStatus status{ service().getStatus() };
        EXPECT_TRUE(status.cooldownActive);
        EXPECT_LE(status.cooldownRemaining, 30s);
        EXPECT_GE(status.cooldownRemaining, 29s);
        EXPECT_EQ(status.queuedCount, 1);
        EXPECT_EQ(status.backlogCount, 1);

        // while in cooldown, captures go straight to the queue
        service().handleCapture(createImage("more spines"));
        ASSERT_TRUE(_observer.waitForDeferred(2));

        status = service().getStatus();
        EXPECT_EQ(status.queuedCount, 2);
        EXPECT_EQ(status.backlogCount, 2);
        EXPECT_EQ(getRequestCount(Method::POST), 1);
        EXPECT_TRUE(_observer.getResults().empty());
    }

    TEST_F(ScanServiceTest, serviceUnavailable)
    {
        createService();

        _httpClient->pushResponse(Method::POST, { .status = 503 });

        service().handleCapture(createImage("spines"));

        ASSERT_TRUE(_observer.waitForDeferred(1));
        EXPECT_EQ(_observer.getDeferred()[0].second, DeferReason::ServiceUnavailable);
        EXPECT_EQ(service().getStatus().queuedCount, 1);
        EXPECT_FALSE(service().getStatus().cooldownActive);
        EXPECT_TRUE(_observer.getResults().empty());
    }

    TEST_F(ScanServiceTest, clientError)
    {
        createService();

        _httpClient->pushResponse(Method::POST, { .status = 422, .body = R"({"message":"No spines detected","code":"E_NO_SPINES"})" });

        service().handleCapture(createImage("spines"));

        ASSERT_TRUE(_observer.waitForResults(1));
        const std::vector<ScanResult> results{ _observer.getResults() };
        ASSERT_FALSE(results[0].isSuccess());
        EXPECT_EQ(results[0].getFailure().code.value_or(""), "E_NO_SPINES");
        EXPECT_NE(results[0].getFailure().reason.find("No spines detected"), std::string::npos);
        EXPECT_FALSE(results[0].getFailure().retryable);
        EXPECT_EQ(service().getStatus().queuedCount, 0);
        EXPECT_EQ(getRequestCount(Method::DELETE), 0);
    }

    TEST_F(ScanServiceTest, drainAtStartup)
    {
        const core::UUID localId1{ core::UUID::generate() };
        const core::UUID localId2{ core::UUID::generate() };
        {
            auto queue{ createDurableQueue(_queueDirectory) };
            queue->enqueue(createImage("first"), "device-1", localId1);
            queue->enqueue(createImage("second"), "device-1", localId2);
        }

        // responses must be scripted before the service starts draining
        auto httpClient{ std::make_unique<FakeHttpClient>(_ioContext) };
        _httpClient = httpClient.get();
        _httpClient->pushResponse(Method::POST, { .status = 202, .body = submitResponseBody("J1") });
        _httpClient->pushResponse(Method::POST, { .status = 202, .body = submitResponseBody("J2") });
        _httpClient->pushResponse(Method::GET, { .chunks = { sseEvent("completed", R"({"books":[{"title":"Dune","author":"Frank Herbert"}]})") } });
        _httpClient->pushResponse(Method::GET, { .chunks = { sseEvent("completed", R"({"books":[{"title":"Emma","author":"Jane Austen"}]})") } });

        ScanServiceSettings settings;
        settings.deviceId = "device-1";
        _service = std::make_unique<ScanService>(_ioContext, _observer, settings, std::make_unique<StreamClient>(_ioContext, std::move(httpClient), StreamClientSettings{}), createCooldownTracker(), createDurableQueue(_queueDirectory));

        ASSERT_TRUE(_observer.waitForResults(2));
        EXPECT_TRUE(_observer.getResults()[0].isSuccess());
        EXPECT_TRUE(_observer.getResults()[1].isSuccess());

        // results are reported under the local ids of the queued captures
        std::vector<core::UUID> resultIds{ _observer.getResults()[0].localId, _observer.getResults()[1].localId };
        EXPECT_TRUE(std::find(std::cbegin(resultIds), std::cend(resultIds), localId1) != std::cend(resultIds));
        EXPECT_TRUE(std::find(std::cbegin(resultIds), std::cend(resultIds), localId2) != std::cend(resultIds));
        EXPECT_TRUE(waitUntil([&] { return service().getStatus().queuedCount == 0; }));

        const std::vector<FakeHttpClient::SentRequest> submits{ _httpClient->getSentRequests(Method::POST) };
        ASSERT_EQ(submits.size(), 2);
        EXPECT_NE(submits[0].body.find("first"), std::string::npos);
        EXPECT_NE(submits[1].body.find("second"), std::string::npos);
    }

    TEST_F(ScanServiceTest, drainPartialFailure)
    {
        {
            auto queue{ createDurableQueue(_queueDirectory) };
            queue->enqueue(createImage("first"), "device-1", core::UUID::generate());
            queue->enqueue(createImage("second"), "device-1", core::UUID::generate());
        }

        auto httpClient{ std::make_unique<FakeHttpClient>(_ioContext) };
        _httpClient = httpClient.get();
        _httpClient->pushResponse(Method::POST, { .status = 202, .body = submitResponseBody("J1") });
        _httpClient->pushResponse(Method::POST, { .status = 400, .body = R"({"message":"Unreadable image"})" });
        _httpClient->pushResponse(Method::GET, { .chunks = { sseEvent("completed", R"({"books":[{"title":"Dune","author":"Frank Herbert"}]})") } });

        ScanServiceSettings settings;
        settings.deviceId = "device-1";
        _service = std::make_unique<ScanService>(_ioContext, _observer, settings, std::make_unique<StreamClient>(_ioContext, std::move(httpClient), StreamClientSettings{}), createCooldownTracker(), createDurableQueue(_queueDirectory));

        ASSERT_TRUE(_observer.waitForResults(2));
        ASSERT_TRUE(waitUntil([&] { return service().getStatus().queuedCount == 1; }));

        // only the successfully submitted payload is removed
        auto queue{ createDurableQueue(_queueDirectory) };
        const std::vector<QueuedPayload> payloads{ queue->drainAll() };
        ASSERT_EQ(payloads.size(), 1);
        EXPECT_EQ(*payloads[0].imageData, createImage("second"));

        // rejected entries are not submitted again by this instance
        service().drainQueue();
        std::this_thread::sleep_for(50ms);
        EXPECT_EQ(getRequestCount(Method::POST), 2);
    }

    TEST_F(ScanServiceTest, startOffline)
    {
        const core::UUID localId{ core::UUID::generate() };
        {
            auto queue{ createDurableQueue(_queueDirectory) };
            queue->enqueue(createImage("first"), "device-1", localId);
        }

        auto httpClient{ std::make_unique<FakeHttpClient>(_ioContext) };
        _httpClient = httpClient.get();
        _httpClient->pushResponse(Method::POST, { .status = 202, .body = submitResponseBody("J1") });
        _httpClient->pushResponse(Method::GET, { .chunks = { sseEvent("completed", R"({"books":[{"title":"Dune","author":"Frank Herbert"}]})") } });

        ScanServiceSettings settings;
        settings.deviceId = "device-1";
        settings.online = false;
        _service = std::make_unique<ScanService>(_ioContext, _observer, settings, std::make_unique<StreamClient>(_ioContext, std::move(httpClient), StreamClientSettings{}), createCooldownTracker(), createDurableQueue(_queueDirectory));

        // no start-up drain
        std::this_thread::sleep_for(50ms);
        EXPECT_EQ(getRequestCount(Method::POST), 0);
        EXPECT_EQ(service().getStatus().queuedCount, 1);

        service().setConnectivity(true);

        ASSERT_TRUE(_observer.waitForResults(1));
        EXPECT_EQ(_observer.getResults()[0].localId, localId);
        EXPECT_EQ(getRequestCount(Method::POST), 1);
    }

    TEST_F(ScanServiceTest, offline)
    {
        createService();

        service().setConnectivity(false);
        const core::UUID localId{ service().handleCapture(createImage("spines")) };

        ASSERT_TRUE(_observer.waitForDeferred(1));
        EXPECT_EQ(_observer.getDeferred()[0].first, localId);
        EXPECT_EQ(_observer.getDeferred()[0].second, DeferReason::Offline);
        EXPECT_EQ(service().getStatus().queuedCount, 1);
        EXPECT_EQ(getRequestCount(Method::POST), 0);

        _httpClient->pushResponse(Method::POST, { .status = 202, .body = submitResponseBody("J7") });
        _httpClient->pushResponse(Method::GET, { .chunks = { sseEvent("completed", R"({"books":[{"title":"Dune","author":"Frank Herbert"}]})") } });

        service().setConnectivity(true);

        ASSERT_TRUE(_observer.waitForResults(1));
        EXPECT_TRUE(_observer.getResults()[0].isSuccess());
        EXPECT_EQ(_observer.getResults()[0].localId, localId);
        EXPECT_EQ(_observer.getResults()[0].jobId.value_or(""), "J7");
        EXPECT_TRUE(waitUntil([&] { return service().getStatus().queuedCount == 0; }));
    }

    TEST_F(ScanServiceTest, cancelAll)
    {
        createService();

        _httpClient->pushResponse(Method::POST, { .status = 202, .body = submitResponseBody("J1") });
        _httpClient->pushResponse(Method::GET, { .chunks = { sseEvent("progress", R"({"message":"Detecting spines"})") }, .keepOpen = true });

        service().handleCapture(createImage("spines"));
        ASSERT_TRUE(waitUntil([&] { return getRequestCount(Method::GET) == 1; }));

        service().cancelAll();
        EXPECT_EQ(service().getStatus().activeCount, 0);
        ASSERT_TRUE(waitUntil([&] { return getRequestCount(Method::DELETE) == 1; }));
        EXPECT_TRUE(_observer.getResults().empty());
    }
} // namespace shelfscan::scan::tests
