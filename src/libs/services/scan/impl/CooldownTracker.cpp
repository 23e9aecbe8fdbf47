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

#include "CooldownTracker.hpp"

#include "core/ILogger.hpp"

#define LOG(sev, message) SHELFSCAN_LOG(SCAN, sev, "[CooldownTracker] - " << message)

namespace shelfscan::scan
{
    std::unique_ptr<ICooldownTracker> createCooldownTracker(NowFunc nowFunc)
    {
        if (!nowFunc)
            nowFunc = [] { return std::chrono::steady_clock::now(); };

        return std::make_unique<CooldownTracker>(std::move(nowFunc));
    }

    CooldownTracker::CooldownTracker(NowFunc nowFunc)
        : _nowFunc{ std::move(nowFunc) }
    {
    }

    void CooldownTracker::recordRateLimit(std::chrono::seconds retryAfter)
    {
        const auto now{ _nowFunc() };

        std::scoped_lock lock{ _mutex };

        _state.isActive = true;
        _state.expiresAt = now + retryAfter;

        LOG(INFO, "Rate limited for " << retryAfter.count() << " seconds, backlog = " << _state.backlogCount);
    }

    bool CooldownTracker::admit()
    {
        const auto now{ _nowFunc() };

        std::scoped_lock lock{ _mutex };
        refreshState(now);

        return !_state.isActive;
    }

    std::chrono::seconds CooldownTracker::getSecondsRemaining()
    {
        const auto now{ _nowFunc() };

        std::scoped_lock lock{ _mutex };
        refreshState(now);

        if (!_state.isActive)
            return std::chrono::seconds{ 0 };

        return std::chrono::ceil<std::chrono::seconds>(_state.expiresAt - now);
    }

    void CooldownTracker::incrementBacklog()
    {
        const auto now{ _nowFunc() };

        std::scoped_lock lock{ _mutex };
        refreshState(now);

        if (_state.isActive)
            _state.backlogCount++;
    }

    CooldownState CooldownTracker::getState()
    {
        const auto now{ _nowFunc() };

        std::scoped_lock lock{ _mutex };
        refreshState(now);

        return _state;
    }

    void CooldownTracker::refreshState(std::chrono::steady_clock::time_point now)
    {
        if (_state.isActive && now >= _state.expiresAt)
        {
            LOG(INFO, "Cooldown expired, " << _state.backlogCount << " job(s) were deferred");
            _state = CooldownState{};
        }
    }
} // namespace shelfscan::scan
