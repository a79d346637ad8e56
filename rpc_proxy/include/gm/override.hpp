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
#include <functional>
#include <utility>
#include "gm/oneshot.hpp"
#include "gm/rpc_types.hpp"

namespace gm {

// What the override decided for one request.
class OverrideResult {
public:
    enum class Kind { sync, async, no_override };

    static OverrideResult sync(ResponsePayload payload) {
        OverrideResult r(Kind::sync);
        r.payload_ = std::move(payload);
        return r;
    }

    // The dispatcher waits on the receiver; whoever holds the matching
    // ReplySender produces the reply.
    static OverrideResult async(ReplyReceiver receiver) {
        OverrideResult r(Kind::async);
        r.receiver_ = std::move(receiver);
        return r;
    }

    static OverrideResult no_override() { return OverrideResult(Kind::no_override); }

    Kind kind() const { return kind_; }
    ResponsePayload& payload() { return payload_; }
    ReplyReceiver& receiver() { return receiver_; }

private:
    explicit OverrideResult(Kind kind) : kind_(kind) {}

    Kind kind_;
    ResponsePayload payload_;
    ReplyReceiver receiver_;
};

// Called once per request, possibly from several worker threads at the
// same time. Throwing maps to an Internal Error reply for that request.
using OverrideFn = std::function<OverrideResult(const Request&)>;

} // namespace gm
