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
#include <memory>

#include <boost/asio/io_context.hpp>

#include "core/UUID.hpp"
#include "services/scan/ScanJob.hpp"
#include "services/scan/ScanResult.hpp"
#include "services/scan/StreamEvent.hpp"

namespace shelfscan::scan
{
    enum class DeferReason
    {
        Offline,
        RateLimited,
        ServiceUnavailable,
    };
    const char* getDeferReasonName(DeferReason reason);

    // Implemented by the catalog store and the presentation layer
    // Called from the IO threads
    class IScanObserver
    {
    public:
        virtual ~IScanObserver() = default;

        // Exactly once per capture that reached a terminal state
        virtual void onTerminalResult(const ScanResult& result) = 0;

        // segmented previews, book progress, ... Default implementations ignore them
        virtual void onIntermediateEvent(const core::UUID& localId, const StreamEvent& event);

        // The capture was stored in the durable queue and will be submitted later
        virtual void onDeferred(const core::UUID& localId, DeferReason reason);
    };

    struct ScanStatus
    {
        std::size_t activeCount{};
        std::size_t waitingCount{};
        std::size_t queuedCount{}; // durable queue
        bool cooldownActive{};
        std::chrono::seconds cooldownRemaining{};
        std::size_t backlogCount{};
    };

    class IScanService
    {
    public:
        virtual ~IScanService() = default;

        // Entry point of the capture pipeline, returns the local id of the job
        virtual core::UUID handleCapture(ImageData imageData) = 0;

        // Going back online triggers a durable queue drain
        virtual void setConnectivity(bool online) = 0;

        // Submits the queued payloads, if allowed
        virtual void drainQueue() = 0;

        // Cancels all the active and waiting jobs, does not block
        virtual void cancelAll() = 0;

        virtual ScanStatus getStatus() = 0;
    };

    // Settings are read from the config service
    // Queued payloads are submitted right away, unless created offline
    std::unique_ptr<IScanService> createScanService(boost::asio::io_context& ioContext, IScanObserver& observer, bool online = true);
} // namespace shelfscan::scan
