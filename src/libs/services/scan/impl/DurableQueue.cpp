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

#include "DurableQueue.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Serializer.h>
#include <Wt/Json/Value.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "services/scan/Exception.hpp"

#define LOG(sev, message) SHELFSCAN_LOG(QUEUE, sev, "[DurableQueue] - " << message)

namespace shelfscan::scan
{
    namespace
    {
        constexpr std::string_view imageExtension{ ".jpg" };
        constexpr std::string_view metadataExtension{ ".json" };
        constexpr std::string_view tmpExtension{ ".tmp" };

        // write to a temporary file, then rename it: readers never see a partial file
        void writeFileAtomically(const std::filesystem::path& path, const char* data, std::size_t size)
        {
            std::filesystem::path tmpPath{ path };
            tmpPath += tmpExtension;

            {
                std::ofstream file{ tmpPath, std::ios::out | std::ios::binary | std::ios::trunc };
                if (!file)
                    throw IOException{ "Cannot open '" + tmpPath.string() + "' for writing", std::error_code{ errno, std::generic_category() } };

                file.write(data, static_cast<std::streamsize>(size));
                file.flush();
                if (!file)
                    throw IOException{ "Cannot write '" + tmpPath.string() + "'", std::error_code{ errno, std::generic_category() } };
            }

            std::error_code ec;
            std::filesystem::rename(tmpPath, path, ec);
            if (ec)
            {
                std::filesystem::remove(tmpPath, ec);
                throw IOException{ "Cannot rename '" + tmpPath.string() + "'", ec };
            }
        }

        std::optional<std::string> readFile(const std::filesystem::path& path)
        {
            std::ifstream file{ path, std::ios::in | std::ios::binary };
            if (!file)
                return std::nullopt;

            std::string content{ std::istreambuf_iterator<char>{ file }, std::istreambuf_iterator<char>{} };
            if (file.bad())
                return std::nullopt;

            return content;
        }

        std::string createMetadata(const QueueEntryId& id, const core::UUID& localId, std::uint64_t sequence, std::string_view deviceId, const Wt::WDateTime& enqueuedAt)
        {
            Wt::Json::Object root;
            root["id"] = Wt::Json::Value{ std::string{ id.getAsString() } };
            root["localId"] = Wt::Json::Value{ std::string{ localId.getAsString() } };
            root["sequence"] = Wt::Json::Value{ static_cast<long long>(sequence) };
            root["deviceId"] = Wt::Json::Value{ std::string{ deviceId } };
            root["enqueuedAt"] = Wt::Json::Value{ core::stringUtils::toISO8601String(enqueuedAt) };

            return Wt::Json::serialize(root);
        }
    } // namespace

    std::unique_ptr<IDurableQueue> createDurableQueue(const std::filesystem::path& directory)
    {
        return std::make_unique<DurableQueue>(directory);
    }

    DurableQueue::DurableQueue(const std::filesystem::path& directory)
        : _directory{ directory }
    {
        std::error_code ec;
        std::filesystem::create_directories(_directory, ec);
        if (ec)
            throw IOException{ "Cannot create queue directory '" + _directory.string() + "'", ec };

        recover();
    }

    QueueEntryId DurableQueue::enqueue(const ImageData& imageData, std::string_view deviceId, const core::UUID& localId)
    {
        const QueueEntryId id{ core::UUID::generate() };

        std::scoped_lock lock{ _mutex };

        const std::uint64_t sequence{ _nextSequence++ };
        try
        {
            writeFileAtomically(getImagePath(id), reinterpret_cast<const char*>(imageData.data()), imageData.size());

            // metadata last: commits the entry
            const std::string metadata{ createMetadata(id, localId, sequence, deviceId, Wt::WDateTime::currentDateTime()) };
            writeFileAtomically(getMetadataPath(id), metadata.data(), metadata.size());
        }
        catch (const IOException& e)
        {
            removeEntryFiles(id);
            throw DurableQueueException{ std::string{ "Cannot enqueue payload: " } + e.what() };
        }

        LOG(DEBUG, "Enqueued entry " << id.getAsString() << ", sequence = " << sequence << ", size = " << imageData.size());
        return id;
    }

    std::vector<QueuedPayload> DurableQueue::drainAll()
    {
        std::vector<QueuedPayload> payloads;
        std::vector<std::filesystem::path> corruptEntries;

        std::scoped_lock lock{ _mutex };

        std::error_code ec;
        for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ _directory, ec })
        {
            if (entry.path().extension() != metadataExtension)
                continue;

            if (std::optional<QueuedPayload> payload{ readEntry(entry.path()) })
                payloads.push_back(std::move(*payload));
            else
                corruptEntries.push_back(entry.path());
        }
        if (ec)
            LOG(ERROR, "Cannot list queue directory '" << _directory.string() << "': " << ec.message());

        for (const std::filesystem::path& metadataPath : corruptEntries)
            removeCorruptEntry(metadataPath);

        std::sort(std::begin(payloads), std::end(payloads), [](const QueuedPayload& lhs, const QueuedPayload& rhs) { return lhs.sequence < rhs.sequence; });

        LOG(DEBUG, "Drained " << payloads.size() << " entries");
        return payloads;
    }

    void DurableQueue::remove(const QueueEntryId& id)
    {
        std::scoped_lock lock{ _mutex };

        removeEntryFiles(id);
        LOG(DEBUG, "Removed entry " << id.getAsString());
    }

    std::size_t DurableQueue::getCount()
    {
        std::size_t count{};

        std::scoped_lock lock{ _mutex };

        std::error_code ec;
        for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ _directory, ec })
        {
            if (entry.path().extension() == metadataExtension)
                count++;
        }

        return count;
    }

    void DurableQueue::recover()
    {
        std::vector<std::filesystem::path> toRemove;
        std::vector<std::filesystem::path> corruptEntries;
        std::uint64_t maxSequence{};
        std::size_t entryCount{};

        std::error_code ec;
        for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ _directory, ec })
        {
            const std::filesystem::path& path{ entry.path() };
            if (path.extension() == tmpExtension)
            {
                toRemove.push_back(path);
            }
            else if (path.extension() == imageExtension)
            {
                // image written but metadata never committed
                std::filesystem::path metadataPath{ path };
                metadataPath.replace_extension(metadataExtension);
                if (!std::filesystem::exists(metadataPath))
                    toRemove.push_back(path);
            }
            else if (path.extension() == metadataExtension)
            {
                if (const std::optional<QueuedPayload> payload{ readEntry(path) })
                {
                    maxSequence = std::max(maxSequence, payload->sequence + 1);
                    entryCount++;
                }
                else
                {
                    corruptEntries.push_back(path);
                }
            }
        }
        if (ec)
            throw IOException{ "Cannot list queue directory '" + _directory.string() + "'", ec };

        for (const std::filesystem::path& path : toRemove)
        {
            LOG(INFO, "Removing incomplete file '" << path.string() << "'");
            std::filesystem::remove(path, ec);
            if (ec)
                LOG(ERROR, "Cannot remove '" << path.string() << "': " << ec.message());
        }

        for (const std::filesystem::path& metadataPath : corruptEntries)
            removeCorruptEntry(metadataPath);

        _nextSequence = maxSequence;
        LOG(INFO, "Durable queue opened in '" << _directory.string() << "', " << entryCount << " pending entries");
    }

    std::filesystem::path DurableQueue::getImagePath(const QueueEntryId& id) const
    {
        return _directory / (std::string{ id.getAsString() } + std::string{ imageExtension });
    }

    std::filesystem::path DurableQueue::getMetadataPath(const QueueEntryId& id) const
    {
        return _directory / (std::string{ id.getAsString() } + std::string{ metadataExtension });
    }

    std::optional<QueuedPayload> DurableQueue::readEntry(const std::filesystem::path& metadataPath) const
    {
        const std::optional<std::string> metadata{ readFile(metadataPath) };
        if (!metadata)
        {
            LOG(ERROR, "Cannot read '" << metadataPath.string() << "'");
            return std::nullopt;
        }

        try
        {
            Wt::Json::Object root;
            Wt::Json::parse(*metadata, root);

            const std::optional<QueueEntryId> id{ core::UUID::fromString(static_cast<std::string>(root.get("id"))) };
            if (!id || metadataPath.stem().string() != id->getAsString())
            {
                LOG(ERROR, "Skipping '" << metadataPath.string() << "': bad or mismatching id");
                return std::nullopt;
            }

            const std::optional<core::UUID> localId{ core::UUID::fromString(static_cast<std::string>(root.get("localId"))) };
            if (!localId)
            {
                LOG(ERROR, "Skipping entry " << id->getAsString() << ": bad local id");
                return std::nullopt;
            }

            std::optional<std::string> image{ readFile(getImagePath(*id)) };
            if (!image)
            {
                LOG(ERROR, "Skipping entry " << id->getAsString() << ": missing image file");
                return std::nullopt;
            }

            const auto* imageBegin{ reinterpret_cast<const std::byte*>(image->data()) };

            QueuedPayload payload{
                .id = *id,
                .localId = *localId,
                .sequence = static_cast<std::uint64_t>(static_cast<long long>(root.get("sequence"))),
                .imageData = std::make_shared<const ImageData>(imageBegin, imageBegin + image->size()),
                .deviceId = static_cast<std::string>(root.get("deviceId").orIfNull("")),
                .enqueuedAt = core::stringUtils::fromISO8601String(static_cast<std::string>(root.get("enqueuedAt").orIfNull(""))),
            };
            return payload;
        }
        catch (const Wt::WException& error)
        {
            LOG(ERROR, "Skipping '" << metadataPath.string() << "': cannot parse metadata: " << error.what());
        }

        return std::nullopt;
    }

    void DurableQueue::removeCorruptEntry(const std::filesystem::path& metadataPath)
    {
        LOG(WARNING, "Removing unreadable entry '" << metadataPath.stem().string() << "'");

        std::filesystem::path imagePath{ metadataPath };
        imagePath.replace_extension(imageExtension);

        std::error_code ec;
        std::filesystem::remove(metadataPath, ec);
        if (ec)
            LOG(ERROR, "Cannot remove '" << metadataPath.string() << "': " << ec.message());

        std::filesystem::remove(imagePath, ec);
        if (ec)
            LOG(ERROR, "Cannot remove '" << imagePath.string() << "': " << ec.message());
    }

    void DurableQueue::removeEntryFiles(const QueueEntryId& id)
    {
        std::error_code ec;

        // metadata first: the entry no longer exists even if the image removal fails
        std::filesystem::remove(getMetadataPath(id), ec);
        if (ec)
            LOG(ERROR, "Cannot remove metadata of entry " << id.getAsString() << ": " << ec.message());

        std::filesystem::remove(getImagePath(id), ec);
        if (ec)
            LOG(ERROR, "Cannot remove image of entry " << id.getAsString() << ": " << ec.message());
    }
} // namespace shelfscan::scan
