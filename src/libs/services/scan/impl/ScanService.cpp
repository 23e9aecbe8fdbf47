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

#include "ScanService.hpp"

#include <algorithm>
#include <latch>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/http/IClient.hpp"
#include "services/scan/Exception.hpp"

#include "DeviceIdentifier.hpp"
#include "StreamClient.hpp"

#define LOG(sev, message) SHELFSCAN_LOG(SCAN, sev, "[ScanService] - " << message)

namespace shelfscan::scan
{
    const char* getDeferReasonName(DeferReason reason)
    {
        switch (reason)
        {
        case DeferReason::Offline:
            return "Offline";
        case DeferReason::RateLimited:
            return "RateLimited";
        case DeferReason::ServiceUnavailable:
            return "ServiceUnavailable";
        }
        return "";
    }

    void IScanObserver::onIntermediateEvent(const core::UUID& /*localId*/, const StreamEvent& /*event*/)
    {
    }

    void IScanObserver::onDeferred(const core::UUID& /*localId*/, DeferReason /*reason*/)
    {
    }

    std::unique_ptr<IScanService> createScanService(boost::asio::io_context& ioContext, IScanObserver& observer, bool online)
    {
        core::IConfig& config{ *core::Service<core::IConfig>::get() };

        const std::filesystem::path workingDir{ config.getPath("working-dir", "/var/shelfscan") };

        ScanServiceSettings settings;
        settings.deviceId = config.getString("device-id", "");
        if (settings.deviceId.empty())
            settings.deviceId = getOrCreateDeviceId(workingDir / "device-id");
        settings.scheduler.maxConcurrentStreams = std::max<std::size_t>(config.getULong("scan-max-concurrent-streams", 5), 1);
        settings.scheduler.maxStreamAttempts = std::max<std::size_t>(config.getULong("scan-stream-max-attempts", 3), 1);
        settings.defaultRetryAfter = std::chrono::seconds{ config.getULong("scan-default-retry-after", 60) };
        settings.online = online;

        StreamClientSettings clientSettings;
        clientSettings.submitTimeout = std::chrono::seconds{ config.getULong("scan-submit-timeout", 30) };
        clientSettings.streamIdleTimeout = std::chrono::seconds{ config.getULong("scan-stream-idle-timeout", 90) };
        clientSettings.retryBaseDelay = std::chrono::seconds{ config.getULong("scan-stream-retry-base-delay", 2) };
        clientSettings.defaultRetryAfter = settings.defaultRetryAfter;

        auto httpClient{ core::http::createClient(ioContext, config.getString("api-base-url", "https://api.oooefam.net")) };
        auto streamClient{ std::make_unique<StreamClient>(ioContext, std::move(httpClient), clientSettings) };
        auto durableQueue{ createDurableQueue(config.getPath("offline-queue-dir", workingDir / "offline-queue")) };

        return std::make_unique<ScanService>(ioContext, observer, settings, std::move(streamClient), createCooldownTracker(), std::move(durableQueue));
    }

    ScanService::ScanService(boost::asio::io_context& ioContext,
        IScanObserver& observer,
        const ScanServiceSettings& settings,
        std::unique_ptr<IStreamClient> streamClient,
        std::unique_ptr<ICooldownTracker> cooldownTracker,
        std::unique_ptr<IDurableQueue> durableQueue)
        : _ioContext{ ioContext }
        , _observer{ observer }
        , _settings{ settings }
        , _streamClient{ std::move(streamClient) }
        , _cooldownTracker{ std::move(cooldownTracker) }
        , _durableQueue{ std::move(durableQueue) }
        , _scheduler{ *_streamClient, *_cooldownTracker, *this, _settings.scheduler }
        , _strand{ _ioContext }
        , _drainTimer{ _ioContext }
        , _online{ _settings.online }
    {
        LOG(INFO, "Started, device id = " << _settings.deviceId << ", " << _durableQueue->getCount() << " queued payload(s)");

        // payloads left by a previous run
        drainQueue();
    }

    ScanService::~ScanService()
    {
        _scheduler.cancelAll();

        if (_ioContext.stopped())
            return;

        std::latch stopLatch{ 1 };
        boost::asio::post(boost::asio::bind_executor(_strand, [this, &stopLatch] {
            _drainTimer.cancel();
            stopLatch.count_down();
        }));
        stopLatch.wait();

        LOG(DEBUG, "Stopped");
    }

    core::UUID ScanService::handleCapture(ImageData imageData)
    {
        auto job{ std::make_shared<ScanJob>(std::make_shared<const ImageData>(std::move(imageData)), _settings.deviceId) };
        const core::UUID localId{ job->getLocalId() };

        LOG(DEBUG, "New capture " << localId.getAsString() << ", size = " << job->getImageData().size());

        if (!_online)
            deferJob(job, DeferReason::Offline);
        else if (!_cooldownTracker->admit())
            deferJob(job, DeferReason::RateLimited);
        else
            _scheduler.start(job);

        return localId;
    }

    void ScanService::setConnectivity(bool online)
    {
        const bool wasOnline{ _online.exchange(online) };
        if (wasOnline == online)
            return;

        LOG(INFO, (online ? "Back online" : "Offline"));
        if (online)
            drainQueue();
    }

    void ScanService::drainQueue()
    {
        boost::asio::post(boost::asio::bind_executor(_strand, [this] {
            doDrain();
        }));
    }

    void ScanService::cancelAll()
    {
        _scheduler.cancelAll();

        // the canceled payloads are still queued and can be drained again
        std::scoped_lock lock{ _mutex };
        _inFlightEntries.clear();
    }

    ScanStatus ScanService::getStatus()
    {
        const CooldownState cooldownState{ _cooldownTracker->getState() };

        ScanStatus status;
        status.activeCount = _scheduler.getActiveCount();
        status.waitingCount = _scheduler.getWaitingCount();
        status.queuedCount = _durableQueue->getCount();
        status.cooldownActive = cooldownState.isActive;
        status.cooldownRemaining = _cooldownTracker->getSecondsRemaining();
        status.backlogCount = cooldownState.backlogCount;

        return status;
    }

    void ScanService::onSubmitted(const ScanJob& job)
    {
        const std::optional<QueueEntryId>& queueEntryId{ job.getQueueEntryId() };
        if (!queueEntryId)
            return;

        // at least once: a crash before this point means a new submission on next drain
        _durableQueue->remove(*queueEntryId);

        std::scoped_lock lock{ _mutex };
        _inFlightEntries.erase(*queueEntryId);
    }

    void ScanService::onIntermediateEvent(const ScanJob& job, const StreamEvent& event)
    {
        _observer.onIntermediateEvent(job.getLocalId(), event);
    }

    void ScanService::onTerminal(const ScanJob& job, const ScanResult& result)
    {
        if (const std::optional<QueueEntryId>& queueEntryId{ job.getQueueEntryId() }; queueEntryId && !job.isSubmitted())
        {
            // rejected before submission: kept on disk, but not submitted again by this instance
            LOG(WARNING, "Queued payload " << queueEntryId->getAsString() << " rejected by the server");

            std::scoped_lock lock{ _mutex };
            _inFlightEntries.erase(*queueEntryId);
            _rejectedEntries.insert(*queueEntryId);
        }

        notifyTerminal(result);
    }

    void ScanService::onRateLimited(std::shared_ptr<ScanJob> job, std::chrono::seconds /*retryAfter*/)
    {
        deferJob(job, DeferReason::RateLimited);
    }

    void ScanService::onSubmitUnavailable(std::shared_ptr<ScanJob> job, const SubmitError& error)
    {
        LOG(DEBUG, "Job " << job->getLocalId().getAsString() << ": service unavailable (" << error.message << ")");
        deferJob(job, DeferReason::ServiceUnavailable);
    }

    void ScanService::deferJob(const std::shared_ptr<ScanJob>& job, DeferReason reason)
    {
        const core::UUID& localId{ job->getLocalId() };

        if (const std::optional<QueueEntryId>& queueEntryId{ job->getQueueEntryId() })
        {
            // still on disk, will be picked up by the next drain
            std::scoped_lock lock{ _mutex };
            _inFlightEntries.erase(*queueEntryId);
        }
        else
        {
            try
            {
                const QueueEntryId queueEntryId{ _durableQueue->enqueue(job->getImageData(), job->getDeviceId(), localId) };
                LOG(DEBUG, "Job " << localId.getAsString() << " deferred (" << getDeferReasonName(reason) << "), queue entry = " << queueEntryId.getAsString());
            }
            catch (const DurableQueueException& e)
            {
                LOG(ERROR, "Cannot defer job " << localId.getAsString() << ": " << e.what());
                notifyTerminal(ScanResult{ .localId = localId, .outcome = ScanFailure{ .reason = std::string{ "Cannot store the capture for later submission: " } + e.what(), .retryable = true } });
                return;
            }
        }

        if (reason == DeferReason::RateLimited)
            _cooldownTracker->incrementBacklog();

        _observer.onDeferred(localId, reason);

        switch (reason)
        {
        case DeferReason::Offline:
            // drained when connectivity is back
            break;

        case DeferReason::RateLimited:
        {
            const std::chrono::seconds delay{ std::max(_cooldownTracker->getSecondsRemaining(), std::chrono::seconds{ 1 }) };
            boost::asio::post(boost::asio::bind_executor(_strand, [this, delay] { scheduleDrain(delay); }));
            break;
        }

        case DeferReason::ServiceUnavailable:
            boost::asio::post(boost::asio::bind_executor(_strand, [this] { scheduleDrain(_settings.defaultRetryAfter); }));
            break;
        }
    }

    // the scheduler reports each job once
    void ScanService::notifyTerminal(const ScanResult& result)
    {
        LOG(DEBUG, "Job " << result.localId.getAsString() << " terminated, success = " << result.isSuccess());
        _observer.onTerminalResult(result);
    }

    void ScanService::scheduleDrain(std::chrono::seconds delay)
    {
        const auto expiry{ std::chrono::steady_clock::now() + delay };
        if (_drainPending && _drainTimer.expiry() <= expiry)
            return;

        LOG(DEBUG, "Next queue drain in " << delay.count() << " seconds");

        _drainPending = true;
        _drainTimer.expires_at(expiry);
        _drainTimer.async_wait(boost::asio::bind_executor(_strand, [this](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted)
                return;
            else if (ec)
                throw Exception{ "Drain timer failure: " + std::string{ ec.message() } };

            _drainPending = false;
            doDrain();
        }));
    }

    void ScanService::doDrain()
    {
        if (!_online)
        {
            LOG(DEBUG, "Offline, not draining queue");
            return;
        }

        std::vector<QueuedPayload> payloads{ _durableQueue->drainAll() };
        if (payloads.empty())
            return;

        LOG(DEBUG, "Draining queue, " << payloads.size() << " payload(s)");

        std::size_t startedCount{};
        for (QueuedPayload& payload : payloads)
        {
            {
                std::scoped_lock lock{ _mutex };
                if (_inFlightEntries.contains(payload.id) || _rejectedEntries.contains(payload.id))
                    continue;
            }

            if (!_cooldownTracker->admit())
            {
                LOG(DEBUG, "Cooldown in progress, stopping queue drain");
                scheduleDrain(std::max(_cooldownTracker->getSecondsRemaining(), std::chrono::seconds{ 1 }));
                break;
            }

            {
                std::scoped_lock lock{ _mutex };
                _inFlightEntries.insert(payload.id);
            }

            _scheduler.start(std::make_shared<ScanJob>(std::move(payload.imageData), payload.deviceId, payload.id, payload.localId));
            startedCount++;
        }

        if (startedCount > 0)
            LOG(INFO, "Resubmitting " << startedCount << " queued payload(s)");
    }
} // namespace shelfscan::scan
