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

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <Wt/WDateTime.h>

#include "core/UUID.hpp"

namespace shelfscan::scan
{
    using ImageData = std::vector<std::byte>;
    using QueueEntryId = core::UUID;

    class ScanJob
    {
    public:
        ScanJob(std::shared_ptr<const ImageData> imageData, std::string deviceId);
        // capture resubmitted from the durable queue, keeps its local id
        ScanJob(std::shared_ptr<const ImageData> imageData, std::string deviceId, const QueueEntryId& queueEntryId, const core::UUID& localId);

        ScanJob(const ScanJob&) = delete;
        ScanJob& operator=(const ScanJob&) = delete;

        const core::UUID& getLocalId() const { return _localId; }
        const ImageData& getImageData() const { return *_imageData; }
        std::shared_ptr<const ImageData> getSharedImageData() const { return _imageData; }
        const std::string& getDeviceId() const { return _deviceId; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }

        // set when the payload comes from the durable queue
        const std::optional<QueueEntryId>& getQueueEntryId() const { return _queueEntryId; }

        // Server side identity, only available once submitted
        // May only be assigned once (throws otherwise)
        void assignRemoteIdentity(std::string jobId, std::optional<std::string> authToken);
        bool isSubmitted() const { return _jobId.has_value(); }
        const std::optional<std::string>& getJobId() const { return _jobId; }
        const std::optional<std::string>& getAuthToken() const { return _authToken; }

    private:
        const core::UUID _localId;
        const std::shared_ptr<const ImageData> _imageData;
        const std::string _deviceId;
        const Wt::WDateTime _createdAt;
        const std::optional<QueueEntryId> _queueEntryId;

        std::optional<std::string> _jobId;
        std::optional<std::string> _authToken;
    };
} // namespace shelfscan::scan
