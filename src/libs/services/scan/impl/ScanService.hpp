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
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <boost/asio/steady_timer.hpp>

#include "services/scan/ICooldownTracker.hpp"
#include "services/scan/IDurableQueue.hpp"
#include "services/scan/IScanService.hpp"

#include "IStreamClient.hpp"
#include "StreamScheduler.hpp"

namespace shelfscan::scan
{
    struct ScanServiceSettings
    {
        std::string deviceId;
        StreamSchedulerSettings scheduler;
        std::chrono::seconds defaultRetryAfter{ 60 }; // delay before draining again after a server side failure
        bool online{ true };                           // initial connectivity, the start-up drain is skipped if offline
    };

    class ScanService final : public IScanService, private StreamScheduler::IListener
    {
    public:
        ScanService(boost::asio::io_context& ioContext,
            IScanObserver& observer,
            const ScanServiceSettings& settings,
            std::unique_ptr<IStreamClient> streamClient,
            std::unique_ptr<ICooldownTracker> cooldownTracker,
            std::unique_ptr<IDurableQueue> durableQueue);
        ~ScanService() override;
        ScanService(const ScanService&) = delete;
        ScanService& operator=(const ScanService&) = delete;

    private:
        // IScanService
        core::UUID handleCapture(ImageData imageData) override;
        void setConnectivity(bool online) override;
        void drainQueue() override;
        void cancelAll() override;
        ScanStatus getStatus() override;

        // StreamScheduler::IListener
        void onSubmitted(const ScanJob& job) override;
        void onIntermediateEvent(const ScanJob& job, const StreamEvent& event) override;
        void onTerminal(const ScanJob& job, const ScanResult& result) override;
        void onRateLimited(std::shared_ptr<ScanJob> job, std::chrono::seconds retryAfter) override;
        void onSubmitUnavailable(std::shared_ptr<ScanJob> job, const SubmitError& error) override;

        void deferJob(const std::shared_ptr<ScanJob>& job, DeferReason reason);
        void notifyTerminal(const ScanResult& result);

        // strand only
        void scheduleDrain(std::chrono::seconds delay);
        void doDrain();

        boost::asio::io_context& _ioContext;
        IScanObserver& _observer;
        const ScanServiceSettings _settings;

        const std::unique_ptr<IStreamClient> _streamClient;
        const std::unique_ptr<ICooldownTracker> _cooldownTracker;
        const std::unique_ptr<IDurableQueue> _durableQueue;
        StreamScheduler _scheduler;

        boost::asio::io_context::strand _strand;
        boost::asio::steady_timer _drainTimer;
        bool _drainPending{}; // strand only

        std::atomic<bool> _online;

        std::mutex _mutex;
        std::unordered_set<QueueEntryId> _inFlightEntries; // drained entries not submitted yet
        std::unordered_set<QueueEntryId> _rejectedEntries; // skipped until next start
    };
} // namespace shelfscan::scan
