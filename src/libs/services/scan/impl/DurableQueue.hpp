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

#include <filesystem>
#include <mutex>
#include <optional>

#include "services/scan/IDurableQueue.hpp"

namespace shelfscan::scan
{
    // One entry = "<id>.jpg" (image) + "<id>.json" (metadata)
    // An entry exists only once its metadata file is present
    class DurableQueue final : public IDurableQueue
    {
    public:
        DurableQueue(const std::filesystem::path& directory);
        ~DurableQueue() override = default;
        DurableQueue(const DurableQueue&) = delete;
        DurableQueue& operator=(const DurableQueue&) = delete;

    private:
        QueueEntryId enqueue(const ImageData& imageData, std::string_view deviceId, const core::UUID& localId) override;
        std::vector<QueuedPayload> drainAll() override;
        void remove(const QueueEntryId& id) override;
        std::size_t getCount() override;

        void recover();
        std::filesystem::path getImagePath(const QueueEntryId& id) const;
        std::filesystem::path getMetadataPath(const QueueEntryId& id) const;
        std::optional<QueuedPayload> readEntry(const std::filesystem::path& metadataPath) const;
        void removeEntryFiles(const QueueEntryId& id);
        void removeCorruptEntry(const std::filesystem::path& metadataPath);

        const std::filesystem::path _directory;
        std::mutex _mutex;
        std::uint64_t _nextSequence{};
    };
} // namespace shelfscan::scan
