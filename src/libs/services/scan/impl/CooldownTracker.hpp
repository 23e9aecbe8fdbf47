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

#include <mutex>

#include "services/scan/ICooldownTracker.hpp"

namespace shelfscan::scan
{
    class CooldownTracker final : public ICooldownTracker
    {
    public:
        CooldownTracker(NowFunc nowFunc);
        ~CooldownTracker() override = default;
        CooldownTracker(const CooldownTracker&) = delete;
        CooldownTracker& operator=(const CooldownTracker&) = delete;

    private:
        void recordRateLimit(std::chrono::seconds retryAfter) override;
        bool admit() override;
        std::chrono::seconds getSecondsRemaining() override;
        void incrementBacklog() override;
        CooldownState getState() override;

        // must be called with the mutex held
        void refreshState(std::chrono::steady_clock::time_point now);

        const NowFunc _nowFunc;
        std::mutex _mutex;
        CooldownState _state;
    };
} // namespace shelfscan::scan
