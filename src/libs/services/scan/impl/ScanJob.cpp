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

#include "services/scan/ScanJob.hpp"

#include "services/scan/Exception.hpp"

namespace shelfscan::scan
{
    ScanJob::ScanJob(std::shared_ptr<const ImageData> imageData, std::string deviceId)
        : _localId{ core::UUID::generate() }
        , _imageData{ std::move(imageData) }
        , _deviceId{ std::move(deviceId) }
        , _createdAt{ Wt::WDateTime::currentDateTime() }
    {
    }

    ScanJob::ScanJob(std::shared_ptr<const ImageData> imageData, std::string deviceId, const QueueEntryId& queueEntryId, const core::UUID& localId)
        : _localId{ localId }
        , _imageData{ std::move(imageData) }
        , _deviceId{ std::move(deviceId) }
        , _createdAt{ Wt::WDateTime::currentDateTime() }
        , _queueEntryId{ queueEntryId }
    {
    }

    void ScanJob::assignRemoteIdentity(std::string jobId, std::optional<std::string> authToken)
    {
        if (_jobId)
            throw Exception{ "Job " + std::string{ _localId.getAsString() } + " already has a remote identity" };

        _jobId = std::move(jobId);
        _authToken = std::move(authToken);
    }
} // namespace shelfscan::scan
