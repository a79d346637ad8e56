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

#include "gm/codec.hpp"
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace gm {

static Error invalid(const std::string& msg, const json& offending) {
    return Error(ErrorKind::invalid_request, msg, offending);
}

Id id_from_json(const json& v) {
    if (v.is_null()) return Id::null();
    if (v.is_number_unsigned()) return Id::from_number(v.get<uint64_t>());
    // ids built in code from signed literals
    if (v.is_number_integer() && v.get<int64_t>() >= 0)
        return Id::from_number(static_cast<uint64_t>(v.get<int64_t>()));
    if (v.is_string()) return Id::from_string(v.get<std::string>());
    throw invalid("invalid type for id: " + dump_json(v) +
                  ", expected unsigned integer, string or null", v);
}

static Id checked_id(const json& obj) {
    auto it = obj.find("id");
    if (it == obj.end()) return Id::null();
    return id_from_json(*it);
}

static void check_marker(const json& obj) {
    auto it = obj.find("jsonrpc");
    if (it == obj.end())
        throw invalid("missing field \"jsonrpc\"", obj);
    if (!it->is_string() || it->get<std::string>() != JSONRPC_VERSION)
        throw invalid("invalid value: " + dump_json(*it) + ", expected \"2.0\"", *it);
}

Request request_from_json(const json& v) {
    if (!v.is_object())
        throw invalid("request must be an object", v);
    check_marker(v);
    auto m = v.find("method");
    if (m == v.end())
        throw invalid("missing field \"method\"", v);
    if (!m->is_string())
        throw invalid("invalid type for method: " + dump_json(*m) + ", expected string", *m);

    Request req;
    req.method = m->get<std::string>();
    auto p = v.find("params");
    if (p != v.end()) req.params = *p;
    req.id = checked_id(v);
    return req;
}

ErrorObj error_obj_from_json(const json& v) {
    if (!v.is_object())
        throw invalid("error must be an object", v);
    auto c = v.find("code");
    if (c == v.end() || !c->is_number_integer())
        throw invalid("error code must be an integer", v);
    int64_t code = c->get<int64_t>();
    if (code < std::numeric_limits<int32_t>::min() || code > std::numeric_limits<int32_t>::max())
        throw invalid("error code out of range", *c);

    ErrorObj e;
    e.code = static_cast<int32_t>(code);
    auto m = v.find("message");
    if (m == v.end() || !m->is_string())
        throw invalid("error message must be a string", v);
    e.message = m->get<std::string>();
    auto d = v.find("data");
    if (d != v.end()) e.data = *d;
    return e;
}

Response response_from_json(const json& v) {
    if (!v.is_object())
        throw invalid("response must be an object", v);
    check_marker(v);
    Response resp;
    resp.id = checked_id(v);
    auto err = v.find("error");
    if (err != v.end() && !err->is_null()) {
        resp.payload = ResponsePayload::failure(error_obj_from_json(*err));
        return resp;
    }
    auto res = v.find("result");
    if (res == v.end())
        throw invalid("response has neither result nor error", v);
    resp.payload = ResponsePayload::success(*res);
    return resp;
}

IncomingBody decode_body(const json& v) {
    IncomingBody body;
    if (v.is_object()) {
        body.requests.push_back(request_from_json(v));
    } else if (v.is_array()) {
        body.batch = true;
        body.requests.reserve(v.size());
        for (const auto& el : v)
            body.requests.push_back(request_from_json(el));
    } else {
        throw Error(ErrorKind::request_parse_failed,
                    "expected a request object or a batch array", v);
    }
    return body;
}

json to_json(const Id& id) {
    switch (id.kind) {
        case Id::Kind::number: return id.number;
        case Id::Kind::string: return id.str;
        case Id::Kind::null: break;
    }
    return nullptr;
}

json to_json(const ErrorObj& e) {
    json j;
    j["code"] = e.code;
    j["message"] = e.message;
    if (e.data) j["data"] = *e.data;
    return j;
}

json to_json(const Request& req) {
    json j;
    j["jsonrpc"] = JSONRPC_VERSION;
    j["method"] = req.method;
    if (req.params) j["params"] = *req.params;
    j["id"] = to_json(req.id);
    return j;
}

json to_json(const Response& resp) {
    json j;
    j["jsonrpc"] = JSONRPC_VERSION;
    if (resp.payload.is_error())
        j["error"] = to_json(*resp.payload.error);
    else
        j["result"] = resp.payload.result;
    j["id"] = to_json(resp.id);
    return j;
}

Response error_response(const Error& e) {
    ErrorCode code = e.kind() == ErrorKind::request_parse_failed
        ? ErrorCode::parse_error : ErrorCode::invalid_request;
    ErrorObj obj = ErrorObj::from_code(code);
    obj.message += std::string(": ") + e.what();
    if (!e.data().is_null()) obj.data = e.data();
    return {ResponsePayload::failure(std::move(obj)), Id::null()};
}

std::string dump_json(const json& v) {
    return v.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace gm
