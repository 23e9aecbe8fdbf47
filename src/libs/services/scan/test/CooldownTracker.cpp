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

#include <gtest/gtest.h>

#include "services/scan/ICooldownTracker.hpp"

namespace shelfscan::scan::tests
{
    namespace
    {
        using namespace std::chrono_literals;

        class FakeClock
        {
        public:
            std::chrono::steady_clock::time_point now() const { return _now; }
            void advance(std::chrono::steady_clock::duration duration) { _now += duration; }

        private:
            std::chrono::steady_clock::time_point _now{ std::chrono::steady_clock::time_point{} + 1000h };
        };

        std::unique_ptr<ICooldownTracker> createTracker(const FakeClock& clock)
        {
            return createCooldownTracker([&clock] { return clock.now(); });
        }
    } // namespace

    TEST(CooldownTracker, initialState)
    {
        FakeClock clock;
        auto tracker{ createTracker(clock) };

        EXPECT_TRUE(tracker->admit());
        EXPECT_EQ(tracker->getSecondsRemaining(), 0s);

        const CooldownState state{ tracker->getState() };
        EXPECT_FALSE(state.isActive);
        EXPECT_EQ(state.backlogCount, 0);
    }

    TEST(CooldownTracker, recordRateLimit)
    {
        FakeClock clock;
        auto tracker{ createTracker(clock) };

        tracker->recordRateLimit(30s);

        const CooldownState state{ tracker->getState() };
        EXPECT_TRUE(state.isActive);
        EXPECT_EQ(state.expiresAt, clock.now() + 30s);
        EXPECT_FALSE(tracker->admit());
        EXPECT_EQ(tracker->getSecondsRemaining(), 30s);
    }

    TEST(CooldownTracker, admitBlockedUntilExpiry)
    {
        FakeClock clock;
        auto tracker{ createTracker(clock) };

        tracker->recordRateLimit(10s);

        clock.advance(9s);
        EXPECT_FALSE(tracker->admit());

        clock.advance(999ms);
        EXPECT_FALSE(tracker->admit());

        clock.advance(1ms);
        EXPECT_TRUE(tracker->admit());
        EXPECT_TRUE(tracker->admit());
        EXPECT_FALSE(tracker->getState().isActive);
    }

    TEST(CooldownTracker, secondsRemainingRoundedUp)
    {
        FakeClock clock;
        auto tracker{ createTracker(clock) };

        tracker->recordRateLimit(5s);
        clock.advance(1500ms);
        EXPECT_EQ(tracker->getSecondsRemaining(), 4s);

        clock.advance(3499ms);
        EXPECT_EQ(tracker->getSecondsRemaining(), 1s);

        clock.advance(1ms);
        EXPECT_EQ(tracker->getSecondsRemaining(), 0s);
    }

    TEST(CooldownTracker, backlog)
    {
        FakeClock clock;
        auto tracker{ createTracker(clock) };

        // not counted when not in cooldown
        tracker->incrementBacklog();
        EXPECT_EQ(tracker->getState().backlogCount, 0);

        tracker->recordRateLimit(20s);
        tracker->incrementBacklog();
        tracker->incrementBacklog();
        EXPECT_EQ(tracker->getState().backlogCount, 2);

        // extending the window keeps the backlog
        tracker->recordRateLimit(60s);
        EXPECT_EQ(tracker->getState().backlogCount, 2);
        EXPECT_EQ(tracker->getSecondsRemaining(), 60s);

        clock.advance(60s);
        EXPECT_TRUE(tracker->admit());
        EXPECT_EQ(tracker->getState().backlogCount, 0);
    }

    TEST(CooldownTracker, shortenedWindow)
    {
        FakeClock clock;
        auto tracker{ createTracker(clock) };

        tracker->recordRateLimit(60s);
        tracker->recordRateLimit(5s);
        EXPECT_EQ(tracker->getSecondsRemaining(), 5s);

        clock.advance(5s);
        EXPECT_TRUE(tracker->admit());
    }
} // namespace shelfscan::scan::tests
