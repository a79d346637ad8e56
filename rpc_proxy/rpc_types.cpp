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

#include "gm/rpc_types.hpp"
#include "gm/error.hpp"

namespace gm {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::request_parse_failed: return "request_parse_failed";
        case ErrorKind::invalid_request: return "invalid_request";
        case ErrorKind::port_binding_failed: return "port_binding_failed";
        case ErrorKind::server_crashed: return "server_crashed";
        case ErrorKind::reply_dropped: return "reply_dropped";
        case ErrorKind::reply_timeout: return "reply_timeout";
        case ErrorKind::request_cancelled: return "request_cancelled";
        case ErrorKind::forwarded_request_failed: return "forwarded_request_failed";
        case ErrorKind::invalid_upstream_url: return "invalid_upstream_url";
        case ErrorKind::request_missing_params: return "request_missing_params";
        case ErrorKind::invalid_params: return "invalid_params";
        case ErrorKind::config_failed: return "config_failed";
    }
    return "unknown";
}

bool Id::operator==(const Id& o) const {
    if (kind != o.kind) return false;
    switch (kind) {
        case Kind::null: return true;
        case Kind::number: return number == o.number;
        case Kind::string: return str == o.str;
    }
    return false;
}

const char* error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::parse_error: return "Parse error";
        case ErrorCode::invalid_request: return "Invalid Request";
        case ErrorCode::method_not_found: return "Method not found";
        case ErrorCode::invalid_params: return "Invalid params";
        case ErrorCode::internal_error: return "Internal error";
        case ErrorCode::user_rejected: return "User rejected the request.";
    }
    return "Server error";
}

ErrorObj ErrorObj::from_code(ErrorCode code) {
    ErrorObj e;
    e.code = static_cast<int32_t>(code);
    e.message = error_code_message(code);
    return e;
}

ErrorObj ErrorObj::user_denied() {
    return from_code(ErrorCode::user_rejected);
}

Response Request::internal_error(const std::string& what) const {
    ErrorObj e = ErrorObj::from_code(ErrorCode::internal_error);
    e.message += ": " + what;
    return respond(ResponsePayload::failure(std::move(e)));
}

} // namespace gm
