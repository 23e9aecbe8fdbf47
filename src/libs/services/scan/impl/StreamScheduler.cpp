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

#include "StreamScheduler.hpp"

#include <optional>
#include <utility>

#include "core/ILogger.hpp"

#define LOG(sev, message) SHELFSCAN_LOG(SCAN, sev, "[StreamScheduler] - " << message)

namespace shelfscan::scan
{
    namespace
    {
        template<class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
    } // namespace

    StreamScheduler::StreamScheduler(IStreamClient& streamClient, ICooldownTracker& cooldownTracker, IListener& listener, const StreamSchedulerSettings& settings)
        : _streamClient{ streamClient }
        , _cooldownTracker{ cooldownTracker }
        , _listener{ listener }
        , _settings{ settings }
    {
        LOG(INFO, "Max concurrent streams = " << _settings.maxConcurrentStreams << ", max stream attempts = " << _settings.maxStreamAttempts);
    }

    StreamScheduler::~StreamScheduler()
    {
        cancelAll();
    }

    void StreamScheduler::start(std::shared_ptr<ScanJob> job)
    {
        bool startNow{};
        {
            std::scoped_lock lock{ _mutex };

            if (_activeJobs.size() < _settings.maxConcurrentStreams)
            {
                _activeJobs.emplace(job->getLocalId(), ActiveJob{ .job = job });
                startNow = true;
            }
            else
            {
                _waitingJobs.push_back(job);
                LOG(DEBUG, "Job " << job->getLocalId().getAsString() << " waiting, " << _waitingJobs.size() << " job(s) in the wait queue");
            }
        }

        if (startNow)
            launchSubmit(job);
    }

    void StreamScheduler::cancelAll()
    {
        std::unordered_map<core::UUID, ActiveJob> activeJobs;
        std::deque<std::shared_ptr<ScanJob>> waitingJobs;
        {
            std::scoped_lock lock{ _mutex };

            activeJobs = std::exchange(_activeJobs, {});
            waitingJobs = std::exchange(_waitingJobs, {});
        }

        if (activeJobs.empty() && waitingJobs.empty())
            return;

        LOG(INFO, "Canceling " << activeJobs.size() << " active job(s) and " << waitingJobs.size() << " waiting job(s)");

        for (auto& [localId, activeJob] : activeJobs)
        {
            if (activeJob.submitOperation)
                activeJob.submitOperation->cancel();
            if (activeJob.streamOperation)
                activeJob.streamOperation->cancel();
            if (activeJob.resultsOperation)
                activeJob.resultsOperation->cancel();

            if (activeJob.job->isSubmitted())
                _streamClient.cleanup(*activeJob.job->getJobId(), activeJob.job->getAuthToken());
        }
    }

    std::size_t StreamScheduler::getActiveCount() const
    {
        std::scoped_lock lock{ _mutex };
        return _activeJobs.size();
    }

    std::size_t StreamScheduler::getWaitingCount() const
    {
        std::scoped_lock lock{ _mutex };
        return _waitingJobs.size();
    }

    void StreamScheduler::promoteWaitingJobs(Promotions& promotions)
    {
        while (!_waitingJobs.empty() && _activeJobs.size() < _settings.maxConcurrentStreams)
        {
            std::shared_ptr<ScanJob> job{ std::move(_waitingJobs.front()) };
            _waitingJobs.pop_front();

            if (!_cooldownTracker.admit())
            {
                promotions.rateLimitedJobs.push_back(std::move(job));
                continue;
            }

            _activeJobs.emplace(job->getLocalId(), ActiveJob{ .job = job });
            promotions.jobsToStart.push_back(std::move(job));
        }
    }

    void StreamScheduler::processPromotions(Promotions& promotions)
    {
        if (!promotions.rateLimitedJobs.empty())
        {
            const std::chrono::seconds retryAfter{ _cooldownTracker.getSecondsRemaining() };
            for (std::shared_ptr<ScanJob>& job : promotions.rateLimitedJobs)
            {
                LOG(DEBUG, "Job " << job->getLocalId().getAsString() << " not promoted, cooldown in progress");
                _listener.onRateLimited(std::move(job), retryAfter);
            }
        }

        for (const std::shared_ptr<ScanJob>& job : promotions.jobsToStart)
        {
            LOG(DEBUG, "Promoting job " << job->getLocalId().getAsString());
            launchSubmit(job);
        }
    }

    void StreamScheduler::launchSubmit(const std::shared_ptr<ScanJob>& job)
    {
        const core::UUID localId{ job->getLocalId() };

        std::unique_ptr<IOperation> operation{ _streamClient.submit(*job, [this, localId](SubmitOutcome outcome) {
            onSubmitOutcome(localId, std::move(outcome));
        }) };

        {
            std::scoped_lock lock{ _mutex };

            auto it{ _activeJobs.find(localId) };
            if (it != std::end(_activeJobs) && it->second.phase == Phase::Submitting)
            {
                it->second.submitOperation = std::move(operation);
                return;
            }
        }

        // canceled or already submitted in the meantime
        if (operation)
            operation->cancel();
    }

    void StreamScheduler::onSubmitOutcome(const core::UUID& localId, SubmitOutcome outcome)
    {
        std::shared_ptr<ScanJob> job{ getActiveJob(localId) };
        if (!job)
        {
            // canceled while the submit was in progress: release what the server may have allocated
            if (const auto* response{ std::get_if<SubmitResponse>(&outcome) })
            {
                LOG(DEBUG, "Job " << localId.getAsString() << " submitted after cancellation, cleaning up");
                _streamClient.cleanup(response->jobId, response->authToken);
            }
            return;
        }

        std::visit(overloaded{
                       [&](const SubmitResponse& response) { onSubmitSuccess(job, response); },
                       [&](const SubmitError& error) { onSubmitError(job, error); },
                   },
            outcome);
    }

    void StreamScheduler::onSubmitSuccess(const std::shared_ptr<ScanJob>& job, const SubmitResponse& response)
    {
        const core::UUID localId{ job->getLocalId() };

        bool stillActive{};
        {
            std::scoped_lock lock{ _mutex };

            auto it{ _activeJobs.find(localId) };
            if (it != std::end(_activeJobs))
            {
                job->assignRemoteIdentity(response.jobId, response.authToken);
                it->second.phase = Phase::Streaming;
                it->second.submitOperation.reset();
                stillActive = true;
            }
        }

        if (!stillActive)
        {
            _streamClient.cleanup(response.jobId, response.authToken);
            return;
        }

        LOG(INFO, "Job " << localId.getAsString() << " submitted, jobId = " << response.jobId);
        _listener.onSubmitted(*job);

        const StreamHandle handle{
            .jobId = response.jobId,
            .streamUrl = response.streamUrl,
            .authToken = response.authToken,
            .deviceId = job->getDeviceId(),
        };

        IStreamClient::StreamCallbacks callbacks;
        callbacks.onEvent = [this, localId](const StreamEvent& event) {
            onStreamEvent(localId, event);
        };
        callbacks.onFailure = [this, localId](const std::string& reason) {
            finishJob(localId, ScanFailure{ .reason = reason, .retryable = true });
        };

        std::unique_ptr<IOperation> operation{ _streamClient.consumeStream(handle, _settings.maxStreamAttempts, std::move(callbacks)) };
        {
            std::scoped_lock lock{ _mutex };

            auto it{ _activeJobs.find(localId) };
            if (it != std::end(_activeJobs) && it->second.phase == Phase::Streaming)
            {
                it->second.streamOperation = std::move(operation);
                return;
            }
        }

        if (operation)
            operation->cancel();
    }

    void StreamScheduler::onSubmitError(const std::shared_ptr<ScanJob>& job, const SubmitError& error)
    {
        const core::UUID& localId{ job->getLocalId() };

        LOG(WARNING, "Job " << localId.getAsString() << ": submit failed (" << getSubmitErrorTypeName(error.type) << "): " << error.message);

        if (error.type == SubmitError::Type::RateLimited)
        {
            _cooldownTracker.recordRateLimit(error.retryAfter);

            Promotions promotions;
            if (std::shared_ptr<ScanJob> releasedJob{ releaseJob(localId, promotions) })
                _listener.onRateLimited(std::move(releasedJob), error.retryAfter);
            processPromotions(promotions);
            return;
        }

        if (error.retryable)
        {
            Promotions promotions;
            if (std::shared_ptr<ScanJob> releasedJob{ releaseJob(localId, promotions) })
                _listener.onSubmitUnavailable(std::move(releasedJob), error);
            processPromotions(promotions);
            return;
        }

        finishJob(localId, ScanFailure{ .reason = error.message, .code = error.code, .retryable = false });
    }

    void StreamScheduler::onStreamEvent(const core::UUID& localId, const StreamEvent& event)
    {
        std::shared_ptr<ScanJob> job;
        {
            std::scoped_lock lock{ _mutex };

            auto it{ _activeJobs.find(localId) };
            if (it == std::end(_activeJobs) || it->second.phase != Phase::Streaming)
                return;

            job = it->second.job;
            if (const auto* bookResult{ std::get_if<event::BookResult>(&event) })
                it->second.streamedBooks.push_back(bookResult->book);
        }

        std::visit(overloaded{
                       [&](const event::Completed& completed) { onCompleted(job, completed); },
                       [&](const event::Failed& failed) {
                           finishJob(localId, ScanFailure{ .reason = failed.message, .code = failed.code, .retryable = failed.retryable });
                       },
                       [&](const event::Canceled&) {
                           finishJob(localId, ScanFailure{ .reason = "Scan was canceled by the server" });
                       },
                       [&](const event::Ping&) {},
                       [&](const event::UnknownIgnorable&) {},
                       [&](const auto&) { _listener.onIntermediateEvent(*job, event); },
                   },
            event);
    }

    void StreamScheduler::onCompleted(const std::shared_ptr<ScanJob>& job, const event::Completed& completed)
    {
        const core::UUID localId{ job->getLocalId() };

        if (completed.inlineBooks && !completed.inlineBooks->empty())
        {
            finishJob(localId, *completed.inlineBooks);
            return;
        }

        if (completed.resultsUrl)
        {
            {
                std::scoped_lock lock{ _mutex };

                auto it{ _activeJobs.find(localId) };
                if (it == std::end(_activeJobs) || it->second.phase != Phase::Streaming)
                    return;

                it->second.phase = Phase::Resolving;
            }

            LOG(DEBUG, "Job " << localId.getAsString() << ": fetching results");
            std::unique_ptr<IOperation> operation{ _streamClient.fetchResults(*completed.resultsUrl, job->getAuthToken(), [this, localId](std::variant<BookList, std::string> result) {
                onResults(localId, std::move(result));
            }) };

            {
                std::scoped_lock lock{ _mutex };

                auto it{ _activeJobs.find(localId) };
                if (it != std::end(_activeJobs) && it->second.phase == Phase::Resolving)
                {
                    it->second.resultsOperation = std::move(operation);
                    return;
                }
            }

            if (operation)
                operation->cancel();
            return;
        }

        onResults(localId, std::string{ "No results URL" });
    }

    void StreamScheduler::onResults(const core::UUID& localId, std::variant<BookList, std::string> result)
    {
        if (auto* books{ std::get_if<BookList>(&result) })
        {
            finishJob(localId, std::move(*books));
            return;
        }

        const std::string& error{ std::get<std::string>(result) };

        BookList streamedBooks;
        {
            std::scoped_lock lock{ _mutex };

            auto it{ _activeJobs.find(localId) };
            if (it == std::end(_activeJobs))
                return;

            streamedBooks = it->second.streamedBooks;
        }

        if (!streamedBooks.empty())
        {
            LOG(DEBUG, "Job " << localId.getAsString() << ": " << error << ", using the " << streamedBooks.size() << " streamed result(s)");
            finishJob(localId, std::move(streamedBooks));
            return;
        }

        LOG(WARNING, "Job " << localId.getAsString() << ": " << error);
        finishJob(localId, ScanFailure{ .reason = "No results available" });
    }

    void StreamScheduler::finishJob(const core::UUID& localId, std::variant<BookList, ScanFailure> outcome)
    {
        std::optional<ActiveJob> finishedJob;
        Promotions promotions;
        {
            std::scoped_lock lock{ _mutex };

            auto it{ _activeJobs.find(localId) };
            if (it == std::end(_activeJobs))
            {
                LOG(DEBUG, "Job " << localId.getAsString() << " already finished");
                return;
            }

            finishedJob.emplace(std::move(it->second));
            _activeJobs.erase(it);

            promoteWaitingJobs(promotions);
        }

        // stops any remaining callback for this job
        if (finishedJob->submitOperation)
            finishedJob->submitOperation->cancel();
        if (finishedJob->streamOperation)
            finishedJob->streamOperation->cancel();
        if (finishedJob->resultsOperation)
            finishedJob->resultsOperation->cancel();

        const ScanJob& job{ *finishedJob->job };
        if (job.isSubmitted())
            _streamClient.cleanup(*job.getJobId(), job.getAuthToken());

        const ScanResult result{ .localId = localId, .jobId = job.getJobId(), .outcome = std::move(outcome) };
        if (result.isSuccess())
            LOG(INFO, "Job " << localId.getAsString() << " done, " << result.getBooks().size() << " book(s) found");
        else
            LOG(INFO, "Job " << localId.getAsString() << " failed: " << result.getFailure().reason);

        _listener.onTerminal(job, result);

        processPromotions(promotions);
    }

    std::shared_ptr<ScanJob> StreamScheduler::releaseJob(const core::UUID& localId, Promotions& promotions)
    {
        std::shared_ptr<ScanJob> job;
        std::optional<ActiveJob> releasedJob;
        {
            std::scoped_lock lock{ _mutex };

            auto it{ _activeJobs.find(localId) };
            if (it == std::end(_activeJobs))
                return job;

            job = it->second.job;
            releasedJob.emplace(std::move(it->second));
            _activeJobs.erase(it);

            promoteWaitingJobs(promotions);
        }

        return job;
    }

    std::shared_ptr<ScanJob> StreamScheduler::getActiveJob(const core::UUID& localId) const
    {
        std::scoped_lock lock{ _mutex };

        auto it{ _activeJobs.find(localId) };
        if (it == std::end(_activeJobs))
            return nullptr;

        return it->second.job;
    }
} // namespace shelfscan::scan
