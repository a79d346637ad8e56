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
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "gm/error.hpp"
#include "gm/oneshot.hpp"
#include "gm/override.hpp"
#include "gm/rpc_types.hpp"

namespace gm {

// A dApp request waiting for the operator's decision.
struct PendingRequest {
    uint64_t seq = 0;
    std::string network;
    std::string method;
    nlohmann::json params;
    ReplySender reply_to;
};

struct PendingSummary {
    uint64_t seq;
    std::string network;
    std::string method;
    nlohmann::json params;
    bool client_gone;
};

enum class Resolution { delivered, not_found, client_gone };

class ApprovalQueue {
    mutable std::mutex mtx_;
    uint64_t next_seq_ = 1;
    std::map<uint64_t, PendingRequest> pending_;
    std::function<void(const PendingSummary&)> on_push_;

    Resolution resolve(uint64_t seq, ResponsePayload payload) {
        ReplySender tx;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = pending_.find(seq);
            if (it == pending_.end()) return Resolution::not_found;
            tx = std::move(it->second.reply_to);
            pending_.erase(it);
        }
        return tx.send(std::move(payload)) ? Resolution::delivered : Resolution::client_gone;
    }

public:
    // Called outside the lock from the worker thread that queued the entry.
    void set_on_push(std::function<void(const PendingSummary&)> fn) { on_push_ = std::move(fn); }

    uint64_t push(const std::string& network, const Request& req, ReplySender reply_to) {
        PendingSummary summary;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            PendingRequest p;
            p.seq = next_seq_++;
            p.network = network;
            p.method = req.method;
            p.params = req.params ? *req.params : nlohmann::json();
            p.reply_to = std::move(reply_to);
            summary = {p.seq, p.network, p.method, p.params, false};
            pending_.emplace(p.seq, std::move(p));
        }
        if (on_push_) on_push_(summary);
        return summary.seq;
    }

    std::vector<PendingSummary> list() const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<PendingSummary> out;
        for (const auto& kv : pending_) {
            const auto& p = kv.second;
            out.push_back({p.seq, p.network, p.method, p.params, p.reply_to.is_closed()});
        }
        return out;
    }

    Resolution approve(uint64_t seq, nlohmann::json result) {
        return resolve(seq, ResponsePayload::success(std::move(result)));
    }

    Resolution reject(uint64_t seq) {
        return resolve(seq, ResponsePayload::failure(ErrorObj::user_denied()));
    }

    // Drops entries nobody waits for any more (timeout, client gone).
    std::vector<uint64_t> prune_closed() {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<uint64_t> gone;
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.reply_to.is_closed()) {
                gone.push_back(it->first);
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
        return gone;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return pending_.size();
    }

    // Waiting callers see a dropped sender.
    void clear() {
        std::map<uint64_t, PendingRequest> dropped;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            dropped.swap(pending_);
        }
    }
};

inline const nlohmann::json& require_params(const Request& req) {
    if (!req.params || req.params->is_null())
        throw Error(ErrorKind::request_missing_params, "Request is missing params for " + req.method);
    return *req.params;
}

// Checks the shape the approval console needs for each sensitive method.
inline void check_sensitive_params(const Request& req) {
    const nlohmann::json& p = require_params(req);
    auto bad = [&req](const std::string& why) {
        return Error(ErrorKind::invalid_params, "Invalid params for " + req.method + ": " + why);
    };
    if (!p.is_array()) throw bad("expected an array");
    if (req.method == "eth_sendTransaction") {
        if (p.size() != 1 || !p[0].is_object()) throw bad("expected [transaction]");
    } else if (req.method == "personal_sign") {
        if (p.size() != 2 || !p[0].is_string() || !p[1].is_string())
            throw bad("expected [message, address]");
    } else if (req.method == "eth_signTypedData_v4") {
        if (p.size() != 2 || !p[0].is_string() || !(p[1].is_object() || p[1].is_string()))
            throw bad("expected [address, typedData]");
    }
}

inline bool is_sensitive_method(const std::string& method) {
    return method == "eth_sendTransaction" || method == "personal_sign" ||
           method == "eth_signTypedData_v4";
}

// Account methods answer at once, signing methods wait for the operator,
// the rest goes to the node.
inline OverrideFn make_wallet_override(ApprovalQueue& queue, std::string network, std::string account) {
    return [&queue, network, account](const Request& req) -> OverrideResult {
        if (req.method == "eth_accounts" || req.method == "eth_requestAccounts") {
            nlohmann::json accounts = nlohmann::json::array();
            if (!account.empty()) accounts.push_back(account);
            return OverrideResult::sync(ResponsePayload::success(accounts));
        }
        if (is_sensitive_method(req.method)) {
            check_sensitive_params(req);
            auto channel = make_reply_channel();
            queue.push(network, req, std::move(channel.first));
            return OverrideResult::async(std::move(channel.second));
        }
        return OverrideResult::no_override();
    };
}

} // namespace gm
