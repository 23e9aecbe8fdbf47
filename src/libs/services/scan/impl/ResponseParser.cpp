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

#include "ResponseParser.hpp"

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Value.h>

#include "core/ILogger.hpp"
#include "services/scan/Exception.hpp"

#include "EventParser.hpp"
#include "JsonUtils.hpp"

#define LOG(sev, message) SHELFSCAN_LOG(SCAN, sev, "[ResponseParser] - " << message)

namespace shelfscan::scan
{
    namespace
    {
        BookList parseBookArray(const Wt::Json::Array& books)
        {
            BookList res;

            for (const Wt::Json::Value& value : books)
            {
                try
                {
                    const Wt::Json::Object& book = value;
                    res.push_back(parseBook(book));
                }
                catch (const Wt::WException& error)
                {
                    LOG(ERROR, "Cannot parse book: " << error.what());
                }
            }

            return res;
        }
    } // namespace

    std::optional<SubmitResponse> parseSubmitResponse(std::string_view body)
    {
        try
        {
            Wt::Json::Object root;
            Wt::Json::parse(std::string{ body }, root);

            if (!json::getOptionalBool(root, "success").value_or(false))
            {
                LOG(ERROR, "Submit response not successful");
                return std::nullopt;
            }

            const Wt::Json::Object& data = root.get("data");

            SubmitResponse response;
            response.jobId = static_cast<std::string>(data.get("jobId"));
            response.streamUrl = static_cast<std::string>(data.get("sseUrl"));
            response.authToken = json::getOptionalString(data, "authToken");
            response.statusUrl = json::getOptionalString(data, "statusUrl");

            if (response.jobId.empty() || response.streamUrl.empty())
            {
                LOG(ERROR, "Submit response has empty jobId or sseUrl");
                return std::nullopt;
            }

            return response;
        }
        catch (const Wt::WException& error)
        {
            LOG(ERROR, "Cannot parse submit response: " << error.what());
        }

        return std::nullopt;
    }

    ProblemDetails parseProblemDetails(std::string_view body)
    {
        ProblemDetails details;

        try
        {
            Wt::Json::Object root;
            Wt::Json::parse(std::string{ body }, root);

            details.message = json::getOptionalString(root, "message");
            if (!details.message)
                details.message = json::getOptionalString(root, "detail");
            details.code = json::getOptionalString(root, "code");
            details.retryable = json::getOptionalBool(root, "retryable");
        }
        catch (const Wt::WException& error)
        {
            LOG(DEBUG, "No problem details in body: " << error.what());
        }

        return details;
    }

    BookList parseResults(std::string_view body)
    {
        Wt::Json::Value root;
        try
        {
            Wt::Json::parse(std::string{ body }, root);
        }
        catch (const Wt::WException& error)
        {
            throw Exception{ std::string{ "Cannot parse results: " } + error.what() };
        }

        if (root.type() == Wt::Json::Type::Array)
            return parseBookArray(root);

        if (root.type() == Wt::Json::Type::Object)
        {
            const Wt::Json::Object& object = root;
            if (object.type("books") == Wt::Json::Type::Array)
                return parseBookArray(object.get("books"));

            if (object.type("data") == Wt::Json::Type::Array)
                return parseBookArray(object.get("data"));

            if (object.type("data") == Wt::Json::Type::Object)
            {
                const Wt::Json::Object& data = object.get("data");
                if (data.type("books") == Wt::Json::Type::Array)
                    return parseBookArray(data.get("books"));
            }
        }

        throw Exception{ "Unexpected results document" };
    }
} // namespace shelfscan::scan
