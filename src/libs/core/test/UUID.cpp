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

#include <set>

#include <gtest/gtest.h>

#include "core/UUID.hpp"

namespace shelfscan::core::tests
{
    TEST(UUID, caseInsensitive)
    {
        const std::optional<UUID> uuid1{ UUID::fromString("3f51c839-bee2-4e9d-a7b7-0693e45178fc") };
        const std::optional<UUID> uuid2{ UUID::fromString("3f51C839-bEE2-4e9d-a7B7-0693e45178fC") };

        EXPECT_EQ(uuid1, uuid2);
        EXPECT_TRUE(uuid1 >= uuid2);
        EXPECT_TRUE(uuid1 <= uuid2);
    }

    TEST(UUID, invalid)
    {
        EXPECT_FALSE(UUID::fromString(""));
        EXPECT_FALSE(UUID::fromString("3f51c839-bee2-4e9d-a7b7"));
        EXPECT_FALSE(UUID::fromString("3f51c839-bee2-4e9d-a7b7-0693e45178fcz"));
        EXPECT_FALSE(UUID::fromString("spine.jpg"));
    }

    TEST(UUID, generate)
    {
        std::set<UUID> uuids;
        for (std::size_t i{}; i < 100; ++i)
        {
            const UUID uuid{ UUID::generate() };
            const std::string_view str{ uuid.getAsString() };

            ASSERT_EQ(str.size(), 36);
            EXPECT_EQ(str[14], '4');
            EXPECT_TRUE(str[19] == '8' || str[19] == '9' || str[19] == 'a' || str[19] == 'b') << str;
            EXPECT_EQ(UUID::fromString(str), uuid);
            uuids.insert(uuid);
        }

        EXPECT_EQ(uuids.size(), 100);
    }
} // namespace shelfscan::core::tests
