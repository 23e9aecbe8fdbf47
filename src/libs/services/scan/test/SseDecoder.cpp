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

#include "SseDecoder.hpp"

namespace shelfscan::scan::tests
{
    namespace
    {
        std::vector<SseRecord> decodeAll(SseDecoder& decoder)
        {
            std::vector<SseRecord> records;
            while (std::optional<SseRecord> record{ decoder.next() })
                records.push_back(std::move(*record));

            return records;
        }
    } // namespace

    TEST(SseDecoder, singleEvent)
    {
        SseDecoder decoder;
        decoder.feed("event: progress\ndata: {\"message\":\"Analyzing\"}\n\n");

        const std::vector<SseRecord> records{ decodeAll(decoder) };
        ASSERT_EQ(records.size(), 1);
        EXPECT_EQ(records[0].name, "progress");
        EXPECT_EQ(records[0].data, R"({"message":"Analyzing"})");
    }

    TEST(SseDecoder, noDispatchWithoutBlankLine)
    {
        SseDecoder decoder;
        decoder.feed("event: progress\ndata: {}\n");
        EXPECT_FALSE(decoder.next());

        decoder.feed("\n");
        EXPECT_TRUE(decoder.next());
        EXPECT_FALSE(decoder.next());
    }

    TEST(SseDecoder, splitAcrossChunks)
    {
        SseDecoder decoder;
        decoder.feed("eve");
        decoder.feed("nt: book_pro");
        decoder.feed("gress\r\nda");
        decoder.feed("ta: {\"current\":1,");
        decoder.feed("\"total\":3}\r\n\r");
        EXPECT_FALSE(decoder.next());
        decoder.feed("\n");

        const std::vector<SseRecord> records{ decodeAll(decoder) };
        ASSERT_EQ(records.size(), 1);
        EXPECT_EQ(records[0].name, "book_progress");
        EXPECT_EQ(records[0].data, R"({"current":1,"total":3})");
    }

    TEST(SseDecoder, multipleEventsInOneChunk)
    {
        SseDecoder decoder;
        decoder.feed("event: progress\ndata: {\"message\":\"a\"}\n\nevent: ping\ndata: {}\n\nevent: completed\ndata: {\"books\":[]}\n\n");

        const std::vector<SseRecord> records{ decodeAll(decoder) };
        ASSERT_EQ(records.size(), 3);
        EXPECT_EQ(records[0].name, "progress");
        EXPECT_EQ(records[1].name, "ping");
        EXPECT_EQ(records[2].name, "completed");
        EXPECT_EQ(records[2].data, R"({"books":[]})");
    }

    TEST(SseDecoder, multiLineData)
    {
        SseDecoder decoder;
        decoder.feed("event: result\ndata: {\"title\":\"Dune\",\ndata: \"author\":\"Frank Herbert\"}\n\n");

        const std::vector<SseRecord> records{ decodeAll(decoder) };
        ASSERT_EQ(records.size(), 1);
        EXPECT_EQ(records[0].data, "{\"title\":\"Dune\",\n\"author\":\"Frank Herbert\"}");
    }

    TEST(SseDecoder, commentsAndDefaultName)
    {
        SseDecoder decoder;
        decoder.feed(": keep-alive\n\ndata: hello\nretry: 3000\n\n");

        const std::vector<SseRecord> records{ decodeAll(decoder) };
        ASSERT_EQ(records.size(), 1);
        EXPECT_EQ(records[0].name, "message");
        EXPECT_EQ(records[0].data, "hello");
    }

    TEST(SseDecoder, lastEventId)
    {
        SseDecoder decoder;
        EXPECT_FALSE(decoder.getLastEventId());

        decoder.feed("id: 12\nevent: progress\ndata: {}\n\n");
        ASSERT_TRUE(decoder.getLastEventId());
        EXPECT_EQ(*decoder.getLastEventId(), "12");

        decoder.feed("event: prog");
        decoder.reset();
        EXPECT_FALSE(decoder.next());
        ASSERT_TRUE(decoder.getLastEventId());
        EXPECT_EQ(*decoder.getLastEventId(), "12");

        // the partial record was dropped
        decoder.feed("data: {}\n\n");
        const std::vector<SseRecord> records{ decodeAll(decoder) };
        ASSERT_EQ(records.size(), 1);
        EXPECT_EQ(records[0].name, "message");
    }

    TEST(SseDecoder, lastEventIdSetOnDispatchOnly)
    {
        SseDecoder decoder;
        decoder.feed("id: 4\nevent: progress\ndata: {}\n\n");
        decoder.feed("id: 5\nevent: completed\ndata: {\"books\":[]}\n");

        ASSERT_TRUE(decoder.getLastEventId());
        EXPECT_EQ(*decoder.getLastEventId(), "4");

        // connection lost before the blank line
        decoder.reset();
        ASSERT_TRUE(decoder.getLastEventId());
        EXPECT_EQ(*decoder.getLastEventId(), "4");

        // the id of the dropped record is not carried over
        decoder.feed("event: completed\ndata: {\"books\":[]}\n\n");
        ASSERT_TRUE(decoder.getLastEventId());
        EXPECT_EQ(*decoder.getLastEventId(), "4");

        decoder.feed("id: 5\nevent: completed\ndata: {\"books\":[]}\n\n");
        EXPECT_EQ(*decoder.getLastEventId(), "5");
    }

    TEST(SseDecoder, singleLeadingSpaceStripped)
    {
        SseDecoder decoder;
        decoder.feed("event: message\ndata:  two spaces \ndata:none\ndata:\ttab\n\n");

        const std::vector<SseRecord> records{ decodeAll(decoder) };
        ASSERT_EQ(records.size(), 1);
        EXPECT_EQ(records[0].data, " two spaces \nnone\n\ttab");
    }
} // namespace shelfscan::scan::tests
