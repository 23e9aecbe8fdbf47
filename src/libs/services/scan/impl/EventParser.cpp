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

#include "EventParser.hpp"

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Serializer.h>
#include <Wt/Json/Value.h>
#include <Wt/Utils.h>

#include "core/ILogger.hpp"
#include "services/scan/Exception.hpp"

#include "JsonUtils.hpp"

#define LOG(sev, message) SHELFSCAN_LOG(SCAN, sev, "[EventParser] - " << message)

namespace shelfscan::scan
{
    namespace
    {
        Wt::Json::Object parseObject(std::string_view name, std::string_view data)
        {
            Wt::Json::Object root;
            try
            {
                Wt::Json::parse(std::string{ data }, root);
            }
            catch (const Wt::WException& error)
            {
                throw MalformedEventException{ "Cannot parse '" + std::string{ name } + "' event payload: " + error.what() };
            }

            return root;
        }

        std::size_t getCount(const Wt::Json::Object& object, const std::string& key)
        {
            const std::optional<long long> value{ json::getOptionalInteger(object, key) };
            if (!value || *value < 0)
                throw MalformedEventException{ "Missing or invalid '" + key + "' field" };

            return static_cast<std::size_t>(*value);
        }

        StreamEvent parseProgress(std::string_view data)
        {
            const Wt::Json::Object root{ parseObject("progress", data) };

            std::optional<std::string> message{ json::getOptionalString(root, "message") };
            if (!message)
                throw MalformedEventException{ "Missing 'message' in progress event" };

            return event::Progress{ std::move(*message) };
        }

        StreamEvent parseResult(std::string_view data)
        {
            const Wt::Json::Object root{ parseObject("result", data) };

            try
            {
                return event::BookResult{ parseBook(root) };
            }
            catch (const Wt::WException& error)
            {
                throw MalformedEventException{ std::string{ "Invalid book in result event: " } + error.what() };
            }
        }

        StreamEvent parseCompleted(std::string_view data)
        {
            event::Completed completed;

            // the payload is optional
            Wt::Json::Object root;
            try
            {
                Wt::Json::parse(std::string{ data }, root);
            }
            catch (const Wt::WException& error)
            {
                LOG(DEBUG, "Completed event without usable payload: " << error.what());
                return completed;
            }

            completed.resultsUrl = json::getOptionalString(root, "resultsUrl");
            if (root.type("books") == Wt::Json::Type::Array)
            {
                const Wt::Json::Array& books = root.get("books");

                BookList inlineBooks;
                for (const Wt::Json::Value& value : books)
                {
                    try
                    {
                        const Wt::Json::Object& book = value;
                        inlineBooks.push_back(parseBook(book));
                    }
                    catch (const Wt::WException& error)
                    {
                        LOG(ERROR, "Cannot parse inline book: " << error.what());
                    }
                }
                completed.inlineBooks = std::move(inlineBooks);
            }

            return completed;
        }

        StreamEvent parseFailed(std::string_view data)
        {
            event::Failed failed{ "Unknown error", std::nullopt, false };

            Wt::Json::Object root;
            try
            {
                Wt::Json::parse(std::string{ data }, root);
            }
            catch (const Wt::WException& error)
            {
                LOG(DEBUG, "Error event without usable payload: " << error.what());
                return failed;
            }

            if (std::optional<std::string> message{ json::getOptionalString(root, "message") })
                failed.message = std::move(*message);
            failed.code = json::getOptionalString(root, "code");
            failed.retryable = json::getOptionalBool(root, "retryable").value_or(false);

            return failed;
        }

        StreamEvent parseSegmented(std::string_view data)
        {
            const Wt::Json::Object root{ parseObject("segmented", data) };

            const std::optional<std::string> image{ json::getOptionalString(root, "image") };
            if (!image || image->empty())
                throw MalformedEventException{ "Missing 'image' in segmented event" };

            const std::string decoded{ Wt::Utils::base64Decode(*image) };
            if (decoded.empty())
                throw MalformedEventException{ "Invalid base64 image in segmented event" };

            event::SegmentedPreview preview;
            preview.totalDetected = getCount(root, "totalBooks");
            const auto* begin{ reinterpret_cast<const std::byte*>(decoded.data()) };
            preview.previewImage.assign(begin, begin + decoded.size());

            return preview;
        }

        StreamEvent parseBookProgress(std::string_view data)
        {
            const Wt::Json::Object root{ parseObject("book_progress", data) };

            event::BookProgress progress;
            progress.currentIndex = getCount(root, "current");
            progress.totalCount = getCount(root, "total");
            progress.stage = json::getOptionalString(root, "stage");

            return progress;
        }

        StreamEvent parseEnrichmentDegraded(std::string_view data)
        {
            const Wt::Json::Object root{ parseObject("enrichment_degraded", data) };

            event::EnrichmentDegraded degraded;
            degraded.reason = json::getOptionalString(root, "reason");
            degraded.isbn = json::getOptionalString(root, "isbn");
            degraded.title = json::getOptionalString(root, "title");
            degraded.fallbackSource = json::getOptionalString(root, "fallbackSource");

            return degraded;
        }
    } // namespace

    StreamEvent parseEvent(std::string_view name, std::string_view data)
    {
        if (name == "progress")
            return parseProgress(data);
        if (name == "result")
            return parseResult(data);
        if (name == "complete" || name == "completed")
            return parseCompleted(data);
        if (name == "error")
            return parseFailed(data);
        if (name == "canceled")
            return event::Canceled{};
        if (name == "segmented")
            return parseSegmented(data);
        if (name == "book_progress")
            return parseBookProgress(data);
        if (name == "enrichment_degraded")
            return parseEnrichmentDegraded(data);
        if (name == "ping")
            return event::Ping{};

        return event::UnknownIgnorable{ std::string{ name } };
    }

    BookMetadata parseBook(const Wt::Json::Object& bookObject)
    {
        BookMetadata book;

        // Mandatory fields
        book.title = static_cast<std::string>(bookObject.get("title"));
        book.author = static_cast<std::string>(bookObject.get("author"));

        // Optional fields
        book.isbn = json::getOptionalString(bookObject, "isbn");
        book.coverUrl = json::getOptionalString(bookObject, "coverUrl");
        book.publisher = json::getOptionalString(bookObject, "publisher");
        book.publishedDate = json::getOptionalString(bookObject, "publishedDate");
        book.format = json::getOptionalString(bookObject, "format");
        if (const std::optional<long long> pageCount{ json::getOptionalInteger(bookObject, "pageCount") }; pageCount && *pageCount > 0)
            book.pageCount = static_cast<int>(*pageCount);
        book.confidence = json::getOptionalNumber(bookObject, "confidence");

        book.rawJson = Wt::Json::serialize(bookObject, 0);

        return book;
    }
} // namespace shelfscan::scan
