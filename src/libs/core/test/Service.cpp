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

#include "core/ILogger.hpp"
#include "core/Service.hpp"

namespace shelfscan::core::tests
{
    class IMyService
    {
    public:
        virtual ~IMyService() = default;
    };

    class MyService : public IMyService
    {
    };

    class MyOtherService : public IMyService
    {
    };

    class MyServiceTag
    {
    };
    class MyOtherServiceTag
    {
    };

    TEST(Service, ctr)
    {
        EXPECT_FALSE(Service<IMyService>().exists());
        EXPECT_EQ(Service<IMyService>().get(), nullptr);

        {
            Service<IMyService> myService{ std::make_unique<MyService>() };

            EXPECT_TRUE(Service<IMyService>().exists());
            EXPECT_EQ(Service<IMyService>().get(), myService.get());
        }

        EXPECT_FALSE(Service<IMyService>().exists());
    }

    TEST(Service, tags)
    {
        Service<IMyService, MyServiceTag> myService{ std::make_unique<MyService>() };
        Service<IMyService, MyOtherServiceTag> myOtherService{ std::make_unique<MyOtherService>() };

        EXPECT_FALSE(Service<IMyService>().exists());

        EXPECT_TRUE((Service<IMyService, MyServiceTag>().exists()));
        EXPECT_TRUE((Service<IMyService, MyOtherServiceTag>().exists()));
        EXPECT_EQ((Service<IMyService, MyServiceTag>().get()), myService.get());
        EXPECT_EQ((Service<IMyService, MyOtherServiceTag>().get()), myOtherService.get());
    }

    TEST(Service, loggingWithoutLogger)
    {
        // no logger registered: must be a no-op
        ASSERT_FALSE(Service<logging::ILogger>::exists());
        SHELFSCAN_LOG(MAIN, ERROR, "nobody listens " << 42);
    }

    TEST(Logger, severityFromString)
    {
        EXPECT_EQ(logging::severityFromString("debug"), logging::Severity::DEBUG);
        EXPECT_EQ(logging::severityFromString("WARNING"), logging::Severity::WARNING);
        EXPECT_EQ(logging::severityFromString("verbose"), std::nullopt);
    }
} // namespace shelfscan::core::tests
