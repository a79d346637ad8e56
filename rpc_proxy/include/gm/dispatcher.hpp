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
#include <chrono>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "gm/oneshot.hpp"
#include "gm/override.hpp"
#include "gm/rpc_types.hpp"
#include "gm/stats.hpp"
#include "gm/upstream.hpp"

namespace gm {

constexpr int ASYNC_REPLY_TIMEOUT_SEC = 180;

class Dispatcher {
    OverrideFn overrider_;
    std::shared_ptr<UpstreamClient> upstream_;
    std::chrono::milliseconds async_timeout_;
    ProxyStats stats_;

    Response forward(const Request& req);
    Response await_reply(const Request& req, ReplyReceiver& rx, const CancelFn& cancelled);

public:
    Dispatcher(OverrideFn overrider, std::shared_ptr<UpstreamClient> upstream,
               std::chrono::milliseconds async_timeout = std::chrono::seconds(ASYNC_REPLY_TIMEOUT_SEC));

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Raw HTTP body in, JSON text out. Always produces an envelope (or an
    // array of them for a batch).
    std::string handle_body(const std::string& body, const CancelFn& cancelled = CancelFn());
    nlohmann::json handle_value(const nlohmann::json& payload, const CancelFn& cancelled = CancelFn());

    // Never throws; failures become Internal Error replies with req.id.
    Response handle_one(const Request& req, const CancelFn& cancelled = CancelFn());

    const ProxyStats& stats() const { return stats_; }
};

} // namespace gm
