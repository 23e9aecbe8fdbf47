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
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <Wt/WDateTime.h>

#include "services/scan/ScanJob.hpp"

namespace shelfscan::scan
{
    // On disk representation of a not yet submitted capture
    struct QueuedPayload
    {
        QueueEntryId id;
        core::UUID localId; // of the capture, kept across restarts
        std::uint64_t sequence{}; // enqueue order
        std::shared_ptr<const ImageData> imageData;
        std::string deviceId;
        Wt::WDateTime enqueuedAt;
    };

    // Survives process restarts. Thread safe.
    class IDurableQueue
    {
    public:
        virtual ~IDurableQueue() = default;

        // throws DurableQueueException
        virtual QueueEntryId enqueue(const ImageData& imageData, std::string_view deviceId, const core::UUID& localId) = 0;

        // all the valid entries, in enqueue order. Only unreadable entries are removed
        virtual std::vector<QueuedPayload> drainAll() = 0;

        // no-op if the entry does not exist
        virtual void remove(const QueueEntryId& id) = 0;

        virtual std::size_t getCount() = 0;
    };

    std::unique_ptr<IDurableQueue> createDurableQueue(const std::filesystem::path& directory);
} // namespace shelfscan::scan
