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

#include "DeviceIdentifier.hpp"

#include <cerrno>
#include <fstream>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "core/UUID.hpp"
#include "services/scan/Exception.hpp"

#define LOG(sev, message) SHELFSCAN_LOG(SCAN, sev, "[DeviceIdentifier] - " << message)

namespace shelfscan::scan
{
    namespace
    {
        std::optional<core::UUID> readDeviceId(const std::filesystem::path& filePath)
        {
            std::ifstream file{ filePath };
            if (!file)
                return std::nullopt;

            std::string line;
            std::getline(file, line);

            return core::UUID::fromString(core::stringUtils::stringTrim(line));
        }
    } // namespace

    std::string getOrCreateDeviceId(const std::filesystem::path& filePath)
    {
        if (const std::optional<core::UUID> deviceId{ readDeviceId(filePath) })
            return std::string{ deviceId->getAsString() };

        const core::UUID deviceId{ core::UUID::generate() };
        LOG(INFO, "Creating device id " << deviceId.getAsString() << " in '" << filePath.string() << "'");

        std::error_code ec;
        if (filePath.has_parent_path())
        {
            std::filesystem::create_directories(filePath.parent_path(), ec);
            if (ec)
                throw IOException{ "Cannot create directory '" + filePath.parent_path().string() + "'", ec };
        }

        std::ofstream file{ filePath, std::ios::out | std::ios::trunc };
        file << deviceId.getAsString() << '\n';
        file.flush();
        if (!file)
            throw IOException{ "Cannot write device id to '" + filePath.string() + "'", std::error_code{ errno, std::generic_category() } };

        return std::string{ deviceId.getAsString() };
    }
} // namespace shelfscan::scan
