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

#include "gm/dispatcher.hpp"
#include "gm/codec.hpp"
#include "gm/error.hpp"
#include "gm/log.hpp"

using json = nlohmann::json;

namespace gm {

Dispatcher::Dispatcher(OverrideFn overrider, std::shared_ptr<UpstreamClient> upstream,
                       std::chrono::milliseconds async_timeout)
    : overrider_(std::move(overrider)), upstream_(std::move(upstream)), async_timeout_(async_timeout) {}

std::string Dispatcher::handle_body(const std::string& body, const CancelFn& cancelled) {
    json payload;
    try {
        payload = json::parse(body);
    } catch (const json::parse_error& e) {
        stats_.parse_failures++;
        GM_LOG_DEBUG("dispatch", "unparsable body: %s", e.what());
        return dump_json(to_json(error_response(Error(ErrorKind::request_parse_failed, e.what()))));
    }
    return dump_json(handle_value(payload, cancelled));
}

json Dispatcher::handle_value(const json& payload, const CancelFn& cancelled) {
    IncomingBody incoming;
    try {
        incoming = decode_body(payload);
    } catch (const Error& e) {
        stats_.parse_failures++;
        GM_LOG_DEBUG("dispatch", "rejected envelope: %s", e.what());
        return to_json(error_response(e));
    }

    if (!incoming.batch)
        return to_json(handle_one(incoming.requests.front(), cancelled));

    stats_.batches++;
    // in order, one at a time
    json out = json::array();
    for (const auto& req : incoming.requests)
        out.push_back(to_json(handle_one(req, cancelled)));
    return out;
}

Response Dispatcher::handle_one(const Request& req, const CancelFn& cancelled) {
    stats_.requests++;
    try {
        OverrideResult outcome = overrider_(req);
        switch (outcome.kind()) {
            case OverrideResult::Kind::sync:
                stats_.sync_overrides++;
                GM_LOG_DEBUG("dispatch", "%s: answered by override", req.method.c_str());
                return req.respond(std::move(outcome.payload()));
            case OverrideResult::Kind::async:
                stats_.async_overrides++;
                return await_reply(req, outcome.receiver(), cancelled);
            case OverrideResult::Kind::no_override:
                break;
        }
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::reply_timeout) stats_.async_timeouts++;
        else if (e.kind() == ErrorKind::reply_dropped) stats_.async_dropped++;
        else if (e.kind() == ErrorKind::request_cancelled) stats_.cancelled++;
        else stats_.override_failures++;
        GM_LOG_WARN("dispatch", "%s: %s", req.method.c_str(), e.what());
        return req.internal_error(e.what());
    } catch (const std::exception& e) {
        stats_.override_failures++;
        GM_LOG_WARN("dispatch", "%s: override failed: %s", req.method.c_str(), e.what());
        return req.internal_error(e.what());
    }
    return forward(req);
}

Response Dispatcher::await_reply(const Request& req, ReplyReceiver& rx, const CancelFn& cancelled) {
    ResponsePayload payload;
    switch (rx.wait(async_timeout_, cancelled, payload)) {
        case RecvStatus::received:
            stats_.async_replies++;
            GM_LOG_DEBUG("dispatch", "%s: async reply received", req.method.c_str());
            return req.respond(std::move(payload));
        case RecvStatus::timed_out:
            throw Error(ErrorKind::reply_timeout,
                        "Timeout. No reply within " + std::to_string(async_timeout_.count()) + "ms");
        case RecvStatus::sender_dropped:
            throw Error(ErrorKind::reply_dropped, "Reply sender dropped before sending a response");
        case RecvStatus::cancelled:
            break;
    }
    throw Error(ErrorKind::request_cancelled, "Client disconnected while waiting for reply");
}

Response Dispatcher::forward(const Request& req) {
    stats_.forwarded++;
    try {
        Response resp = upstream_->forward(req);
        GM_LOG_DEBUG("dispatch", "%s: forwarded", req.method.c_str());
        return resp;
    } catch (const Error& e) {
        stats_.upstream_failures++;
        GM_LOG_WARN("upstream", "%s: %s", req.method.c_str(), e.what());
        return req.internal_error(e.what());
    }
}

} // namespace gm
