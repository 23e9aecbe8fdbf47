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
#include <functional>
#include <memory>

namespace shelfscan::scan
{
    struct CooldownState
    {
        bool isActive{};
        std::chrono::steady_clock::time_point expiresAt; // only meaningful if active
        std::size_t backlogCount{};                      // always 0 if not active
    };

    // Single source of truth for the server imposed rate limit
    // Thread safe, no I/O
    class ICooldownTracker
    {
    public:
        virtual ~ICooldownTracker() = default;

        // Starts (or extends/shortens) the cooldown window, backlog unchanged
        virtual void recordRateLimit(std::chrono::seconds retryAfter) = 0;

        // false while in cooldown. Once expired, resets the state and returns true
        virtual bool admit() = 0;

        // Rounded up to the next second, 0 if not active
        virtual std::chrono::seconds getSecondsRemaining() = 0;

        // Counts a job deferred because of the cooldown, no-op if not active
        virtual void incrementBacklog() = 0;

        virtual CooldownState getState() = 0;
    };

    using NowFunc = std::function<std::chrono::steady_clock::time_point()>;
    std::unique_ptr<ICooldownTracker> createCooldownTracker(NowFunc nowFunc = {});
} // namespace shelfscan::scan
