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

#include <algorithm>
#include <fstream>

#include <gtest/gtest.h>

#include "core/UUID.hpp"
#include "services/scan/IDurableQueue.hpp"

namespace shelfscan::scan::tests
{
    namespace
    {
        ImageData createImage(std::string_view content)
        {
            ImageData image(content.size());
            std::transform(std::cbegin(content), std::cend(content), std::begin(image), [](char c) { return std::byte{ static_cast<unsigned char>(c) }; });
            return image;
        }

        void writeFile(const std::filesystem::path& path, std::string_view content)
        {
            std::ofstream file{ path, std::ios::binary | std::ios::trunc };
            file << content;
        }

        class DurableQueueTest : public ::testing::Test
        {
        protected:
            void SetUp() override
            {
                _directory = std::filesystem::temp_directory_path() / ("shelfscan-queue-" + std::string{ core::UUID::generate().getAsString() });
            }

            void TearDown() override
            {
                std::error_code ec;
                std::filesystem::remove_all(_directory, ec);
            }

            std::size_t countFiles() const
            {
                return std::distance(std::filesystem::directory_iterator{ _directory }, std::filesystem::directory_iterator{});
            }

            std::filesystem::path _directory;
        };
    } // namespace

    TEST_F(DurableQueueTest, empty)
    {
        auto queue{ createDurableQueue(_directory) };

        EXPECT_TRUE(std::filesystem::is_directory(_directory));
        EXPECT_EQ(queue->getCount(), 0);
        EXPECT_TRUE(queue->drainAll().empty());
    }

    TEST_F(DurableQueueTest, enqueueDrainRemove)
    {
        auto queue{ createDurableQueue(_directory) };

        const core::UUID localId1{ core::UUID::generate() };
        const QueueEntryId id1{ queue->enqueue(createImage("first"), "device-1", localId1) };
        const QueueEntryId id2{ queue->enqueue(createImage("second"), "device-1", core::UUID::generate()) };
        EXPECT_NE(id1, id2);
        EXPECT_EQ(queue->getCount(), 2);

        {
            const std::vector<QueuedPayload> payloads{ queue->drainAll() };
            ASSERT_EQ(payloads.size(), 2);
            EXPECT_EQ(payloads[0].id, id1);
            EXPECT_EQ(payloads[1].id, id2);
            EXPECT_LT(payloads[0].sequence, payloads[1].sequence);
            ASSERT_NE(payloads[0].imageData, nullptr);
            EXPECT_EQ(*payloads[0].imageData, createImage("first"));
            EXPECT_EQ(payloads[0].deviceId, "device-1");
            EXPECT_EQ(payloads[0].localId, localId1);
            EXPECT_TRUE(payloads[0].enqueuedAt.isValid());
        }

        // drain does not remove anything
        EXPECT_EQ(queue->getCount(), 2);

        queue->remove(id1);
        EXPECT_EQ(queue->getCount(), 1);
        {
            const std::vector<QueuedPayload> payloads{ queue->drainAll() };
            ASSERT_EQ(payloads.size(), 1);
            EXPECT_EQ(payloads[0].id, id2);
        }

        // no-op
        queue->remove(id1);
        queue->remove(core::UUID::generate());
        EXPECT_EQ(queue->getCount(), 1);

        queue->remove(id2);
        EXPECT_EQ(queue->getCount(), 0);
        EXPECT_EQ(countFiles(), 0);
    }

    TEST_F(DurableQueueTest, survivesRestart)
    {
        std::vector<QueueEntryId> ids;
        std::vector<core::UUID> localIds;
        {
            auto queue{ createDurableQueue(_directory) };
            for (std::size_t i{}; i < 5; ++i)
            {
                localIds.push_back(core::UUID::generate());
                ids.push_back(queue->enqueue(createImage("image-" + std::to_string(i)), "device-1", localIds.back()));
            }
        }

        auto queue{ createDurableQueue(_directory) };
        EXPECT_EQ(queue->getCount(), 5);

        // new entries go after the recovered ones
        ids.push_back(queue->enqueue(createImage("image-5"), "device-2", core::UUID::generate()));

        const std::vector<QueuedPayload> payloads{ queue->drainAll() };
        ASSERT_EQ(payloads.size(), ids.size());
        for (std::size_t i{}; i < ids.size(); ++i)
        {
            EXPECT_EQ(payloads[i].id, ids[i]);
            EXPECT_EQ(*payloads[i].imageData, createImage("image-" + std::to_string(i)));
            if (i < localIds.size())
                EXPECT_EQ(payloads[i].localId, localIds[i]);
        }
        EXPECT_EQ(payloads.back().deviceId, "device-2");
    }

    TEST_F(DurableQueueTest, incompleteEntriesRemovedOnRecovery)
    {
        QueueEntryId id{ core::UUID::generate() };
        {
            auto queue{ createDurableQueue(_directory) };
            id = queue->enqueue(createImage("committed"), "device-1", core::UUID::generate());
        }

        // crash while writing: orphan image and temporary files
        const std::string orphanId{ core::UUID::generate().getAsString() };
        writeFile(_directory / (orphanId + ".jpg"), "orphan");
        writeFile(_directory / (orphanId + ".json.tmp"), "{");

        auto queue{ createDurableQueue(_directory) };
        EXPECT_EQ(countFiles(), 2);

        const std::vector<QueuedPayload> payloads{ queue->drainAll() };
        ASSERT_EQ(payloads.size(), 1);
        EXPECT_EQ(payloads[0].id, id);
    }

    TEST_F(DurableQueueTest, corruptEntrySkipped)
    {
        auto queue{ createDurableQueue(_directory) };
        const QueueEntryId id1{ queue->enqueue(createImage("first"), "device-1", core::UUID::generate()) };
        const QueueEntryId id2{ queue->enqueue(createImage("second"), "device-1", core::UUID::generate()) };

        writeFile(_directory / (std::string{ id1.getAsString() } + ".json"), "garbage");

        const std::vector<QueuedPayload> payloads{ queue->drainAll() };
        ASSERT_EQ(payloads.size(), 1);
        EXPECT_EQ(payloads[0].id, id2);

        // the unreadable entry is gone, image included
        EXPECT_EQ(queue->getCount(), 1);
        EXPECT_EQ(countFiles(), 2);
    }

    TEST_F(DurableQueueTest, corruptEntriesRemovedOnRecovery)
    {
        QueueEntryId id{ core::UUID::generate() };
        {
            auto queue{ createDurableQueue(_directory) };
            const QueueEntryId garbageId{ queue->enqueue(createImage("first"), "device-1", core::UUID::generate()) };
            const QueueEntryId imagelessId{ queue->enqueue(createImage("second"), "device-1", core::UUID::generate()) };
            id = queue->enqueue(createImage("third"), "device-1", core::UUID::generate());

            writeFile(_directory / (std::string{ garbageId.getAsString() } + ".json"), "garbage");
            std::filesystem::remove(_directory / (std::string{ imagelessId.getAsString() } + ".jpg"));
        }

        auto queue{ createDurableQueue(_directory) };
        EXPECT_EQ(queue->getCount(), 1);
        EXPECT_EQ(countFiles(), 2);

        const std::vector<QueuedPayload> payloads{ queue->drainAll() };
        ASSERT_EQ(payloads.size(), 1);
        EXPECT_EQ(payloads[0].id, id);
    }
} // namespace shelfscan::scan::tests
