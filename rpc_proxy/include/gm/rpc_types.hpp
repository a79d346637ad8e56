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
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace gm {

constexpr const char* JSONRPC_VERSION = "2.0";

// Request/response id: unsigned integer, string or null.
struct Id {
    enum class Kind { null, number, string };

    Kind kind = Kind::null;
    uint64_t number = 0;
    std::string str;

    static Id null() { return Id(); }
    static Id from_number(uint64_t n) {
        Id id;
        id.kind = Kind::number;
        id.number = n;
        return id;
    }
    static Id from_string(std::string s) {
        Id id;
        id.kind = Kind::string;
        id.str = std::move(s);
        return id;
    }

    bool is_null() const { return kind == Kind::null; }
    bool operator==(const Id& o) const;
    bool operator!=(const Id& o) const { return !(*this == o); }
};

enum class ErrorCode : int32_t {
    parse_error = -32700,
    invalid_request = -32600,
    method_not_found = -32601,
    invalid_params = -32602,
    internal_error = -32603,
    user_rejected = -4001,
};

struct ErrorObj {
    int32_t code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    static ErrorObj from_code(ErrorCode code);
    static ErrorObj user_denied();
};

// Exactly one of result / error.
struct ResponsePayload {
    nlohmann::json result;
    std::optional<ErrorObj> error;

    bool is_error() const { return error.has_value(); }

    static ResponsePayload success(nlohmann::json v) {
        ResponsePayload p;
        p.result = std::move(v);
        return p;
    }
    static ResponsePayload failure(ErrorObj e) {
        ResponsePayload p;
        p.error = std::move(e);
        return p;
    }
};

struct Response {
    ResponsePayload payload;
    Id id;
};

struct Request {
    std::string method;
    std::optional<nlohmann::json> params;
    Id id;

    Response respond(ResponsePayload payload) const { return {std::move(payload), id}; }
    Response success(nlohmann::json v) const { return respond(ResponsePayload::success(std::move(v))); }
    Response internal_error(const std::string& what) const;
};

const char* error_code_message(ErrorCode code);

} // namespace gm
