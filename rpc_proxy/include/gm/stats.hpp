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
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace gm {

// Per-server counters, updated from worker threads without locking.
struct ProxyStats {
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> batches{0};
    std::atomic<uint64_t> parse_failures{0};
    std::atomic<uint64_t> sync_overrides{0};
    std::atomic<uint64_t> async_overrides{0};
    std::atomic<uint64_t> async_replies{0};
    std::atomic<uint64_t> async_timeouts{0};
    std::atomic<uint64_t> async_dropped{0};
    std::atomic<uint64_t> cancelled{0};
    std::atomic<uint64_t> forwarded{0};
    std::atomic<uint64_t> upstream_failures{0};
    std::atomic<uint64_t> override_failures{0};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["requests"] = requests.load();
        j["batches"] = batches.load();
        j["parse_failures"] = parse_failures.load();
        j["sync_overrides"] = sync_overrides.load();
        j["async_overrides"] = async_overrides.load();
        j["async_replies"] = async_replies.load();
        j["async_timeouts"] = async_timeouts.load();
        j["async_dropped"] = async_dropped.load();
        j["cancelled"] = cancelled.load();
        j["forwarded"] = forwarded.load();
        j["upstream_failures"] = upstream_failures.load();
        j["override_failures"] = override_failures.load();
        return j;
    }
};

} // namespace gm
