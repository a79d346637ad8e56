/*
    This file is part of gm wallet (devrpc).

    gm wallet is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 2 of the License, or
    (at your option) any later version.

    gm wallet is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with gm wallet.  If not, see <http://www.gnu.org/licenses/>.

    This program is released under the GPL with the additional exemption
    that compiling, linking, and/or using OpenSSL is allowed.
    You are free to remove this exemption from derived works.
*/

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "gm/error.hpp"
#include "gm/rpc_types.hpp"

namespace gm {

// A decoded HTTP body: one request, or a batch (possibly empty).
struct IncomingBody {
    bool batch = false;
    std::vector<Request> requests;
};

// Envelope decoding. Throws Error(invalid_request) with the offending
// value in data() on a bad marker, id or method.
Id id_from_json(const nlohmann::json& v);
Request request_from_json(const nlohmann::json& v);
ErrorObj error_obj_from_json(const nlohmann::json& v);
Response response_from_json(const nlohmann::json& v);

// Object -> single request, array -> batch. Any other shape throws
// Error(request_parse_failed).
IncomingBody decode_body(const nlohmann::json& v);

nlohmann::json to_json(const Id& id);
nlohmann::json to_json(const ErrorObj& e);
nlohmann::json to_json(const Request& req);
nlohmann::json to_json(const Response& resp);

// Envelope for a failure that happened before any id was known.
Response error_response(const Error& e);

// Never throws on strings with invalid UTF-8.
std::string dump_json(const nlohmann::json& v);

} // namespace gm
