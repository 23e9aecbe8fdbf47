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

#include <Wt/WDate.h>
#include <Wt/WDateTime.h>
#include <Wt/WTime.h>

#include "core/String.hpp"

namespace shelfscan::core::stringUtils::tests
{
    TEST(StringUtils, stringTrim)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view expectedOutput;
        };

        TestCase tests[]{
            { "", "" },
            { " ", "" },
            { "a", "a" },
            { " a ", "a" },
            { "\ta\r", "a" },
            { " a b ", "a b" },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(stringTrim(test.input), test.expectedOutput) << "Input = '" << test.input << "'";
    }

    TEST(StringUtils, caseInsensitive)
    {
        EXPECT_EQ(stringToLower("Retry-After"), "retry-after");
        EXPECT_TRUE(stringCaseInsensitiveEqual("Text/Event-Stream", "text/event-stream"));
        EXPECT_FALSE(stringCaseInsensitiveEqual("text", "texts"));
    }

    TEST(StringUtils, readAs_seconds)
    {
        struct TestCase
        {
            std::string_view input;
            std::optional<std::chrono::seconds> expectedOutput;
        };

        TestCase tests[]{
            { "30", std::chrono::seconds{ 30 } },
            { " 60 ", std::chrono::seconds{ 60 } },
            { "0", std::chrono::seconds{ 0 } },
            { "", std::nullopt },
            { "-5", std::nullopt },
            { "12abc", std::nullopt },
            { "Wed, 21 Oct 2015 07:28:00 GMT", std::nullopt },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(readAs<std::chrono::seconds>(test.input), test.expectedOutput) << "Input = '" << test.input << "'";
    }

    TEST(StringUtils, ISO8601)
    {
        const Wt::WDateTime dateTime{ Wt::WDate{ 2025, 3, 14 }, Wt::WTime{ 9, 26, 53, 589 } };

        const std::string str{ toISO8601String(dateTime) };
        EXPECT_EQ(str, "2025-03-14T09:26:53.589Z");
        EXPECT_EQ(fromISO8601String(str), dateTime);
        EXPECT_FALSE(fromISO8601String("not a date").isValid());
        EXPECT_EQ(toISO8601String(Wt::WDateTime{}), "");
    }
} // namespace shelfscan::core::stringUtils::tests
