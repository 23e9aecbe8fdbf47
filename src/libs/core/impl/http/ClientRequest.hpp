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

#pragma once

#include <variant>

#include "core/http/ClientRequestParameters.hpp"

namespace shelfscan::core::http
{
    class ClientRequest
    {
    public:
        ClientRequest(ClientGETRequestParameters&& GETParams)
            : _parameters{ std::move(GETParams) } {}
        ClientRequest(ClientPOSTRequestParameters&& POSTParams)
            : _parameters{ std::move(POSTParams) } {}
        ClientRequest(ClientDELETERequestParameters&& DELETEParams)
            : _parameters{ std::move(DELETEParams) } {}

        const ClientRequestParameters& getParameters() const
        {
            return std::visit([](const auto& parameters) -> const ClientRequestParameters& {
                return parameters;
            },
                              _parameters);
        }

        enum class Type
        {
            GET,
            POST,
            DELETE,
        };
        Type getType() const
        {
            if (std::holds_alternative<ClientGETRequestParameters>(_parameters))
                return Type::GET;
            if (std::holds_alternative<ClientPOSTRequestParameters>(_parameters))
                return Type::POST;
            return Type::DELETE;
        }

        const ClientGETRequestParameters& getGETParameters() const { return std::get<ClientGETRequestParameters>(_parameters); }
        const ClientPOSTRequestParameters& getPOSTParameters() const { return std::get<ClientPOSTRequestParameters>(_parameters); }
        const ClientDELETERequestParameters& getDELETEParameters() const { return std::get<ClientDELETERequestParameters>(_parameters); }

    private:
        std::variant<ClientGETRequestParameters, ClientPOSTRequestParameters, ClientDELETERequestParameters> _parameters;
    };

    inline const char* getTypeName(ClientRequest::Type type)
    {
        switch (type)
        {
        case ClientRequest::Type::GET:
            return "GET";
        case ClientRequest::Type::POST:
            return "POST";
        case ClientRequest::Type::DELETE:
            return "DELETE";
        }
        return "";
    }
} // namespace shelfscan::core::http
