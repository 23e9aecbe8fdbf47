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
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "core/UUID.hpp"
#include "services/scan/ICooldownTracker.hpp"
#include "services/scan/ScanJob.hpp"
#include "services/scan/ScanResult.hpp"
#include "services/scan/StreamEvent.hpp"

#include "IStreamClient.hpp"

namespace shelfscan::scan
{
    struct StreamSchedulerSettings
    {
        std::size_t maxConcurrentStreams{ 5 };
        std::size_t maxStreamAttempts{ 3 };
    };

    // Runs jobs from submit to terminal outcome, at most maxConcurrentStreams at a time
    // Jobs exceeding the ceiling wait in a FIFO queue
    // Listener calls are never made while holding the internal lock
    class StreamScheduler
    {
    public:
        class IListener
        {
        public:
            virtual ~IListener() = default;

            // The job has a server side identity
            virtual void onSubmitted(const ScanJob& job) = 0;
            virtual void onIntermediateEvent(const ScanJob& job, const StreamEvent& event) = 0;
            // At most once per job
            virtual void onTerminal(const ScanJob& job, const ScanResult& result) = 0;
            // Not submitted because of a rate limit, to be resubmitted later
            virtual void onRateLimited(std::shared_ptr<ScanJob> job, std::chrono::seconds retryAfter) = 0;
            // Not submitted because of a retryable server or connection error
            virtual void onSubmitUnavailable(std::shared_ptr<ScanJob> job, const SubmitError& error) = 0;
        };

        StreamScheduler(IStreamClient& streamClient, ICooldownTracker& cooldownTracker, IListener& listener, const StreamSchedulerSettings& settings);
        ~StreamScheduler();
        StreamScheduler(const StreamScheduler&) = delete;
        StreamScheduler& operator=(const StreamScheduler&) = delete;

        void start(std::shared_ptr<ScanJob> job);

        // Does not block, no listener call is made for the canceled jobs
        void cancelAll();

        std::size_t getActiveCount() const;
        std::size_t getWaitingCount() const;

    private:
        enum class Phase
        {
            Submitting,
            Streaming,
            Resolving, // fetching the results
        };

        struct ActiveJob
        {
            std::shared_ptr<ScanJob> job;
            Phase phase{ Phase::Submitting };
            std::unique_ptr<IOperation> submitOperation;
            std::unique_ptr<IOperation> streamOperation;
            std::unique_ptr<IOperation> resultsOperation;
            BookList streamedBooks;
        };

        struct Promotions
        {
            std::vector<std::shared_ptr<ScanJob>> jobsToStart;
            std::vector<std::shared_ptr<ScanJob>> rateLimitedJobs;
        };

        // mutex must be held
        void promoteWaitingJobs(Promotions& promotions);
        void processPromotions(Promotions& promotions);

        void launchSubmit(const std::shared_ptr<ScanJob>& job);
        void onSubmitOutcome(const core::UUID& localId, SubmitOutcome outcome);
        void onSubmitSuccess(const std::shared_ptr<ScanJob>& job, const SubmitResponse& response);
        void onSubmitError(const std::shared_ptr<ScanJob>& job, const SubmitError& error);

        void onStreamEvent(const core::UUID& localId, const StreamEvent& event);
        void onCompleted(const std::shared_ptr<ScanJob>& job, const event::Completed& completed);
        void onResults(const core::UUID& localId, std::variant<BookList, std::string> result);

        // no-op if the job is no longer active
        void finishJob(const core::UUID& localId, std::variant<BookList, ScanFailure> outcome);
        // releases the slot without terminal outcome nor cleanup
        std::shared_ptr<ScanJob> releaseJob(const core::UUID& localId, Promotions& promotions);

        std::shared_ptr<ScanJob> getActiveJob(const core::UUID& localId) const;

        IStreamClient& _streamClient;
        ICooldownTracker& _cooldownTracker;
        IListener& _listener;
        const StreamSchedulerSettings _settings;

        mutable std::mutex _mutex;
        std::unordered_map<core::UUID, ActiveJob> _activeJobs;
        std::deque<std::shared_ptr<ScanJob>> _waitingJobs;
    };
} // namespace shelfscan::scan
