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
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <httplib.h>
#include "gm/rpc_types.hpp"

namespace gm {

struct UpstreamUrl {
    bool ssl = false;
    std::string host;
    int port = 80;
    std::string path = "/";

    std::string to_string() const;
};

// Accepts absolute http:// and https:// URLs. Throws
// Error(invalid_upstream_url).
UpstreamUrl parse_upstream_url(const std::string& url);

struct UpstreamOptions {
    int timeout_sec = 30;
    bool verify_tls = true;
    size_t max_idle = 16;
};

// Forwards requests to the real RPC node. Keep-alive clients are pooled;
// each pooled client carries one request at a time.
class UpstreamClient {
    UpstreamUrl url_;
    UpstreamOptions opts_;
    std::mutex mtx_;
    std::vector<std::unique_ptr<httplib::ClientImpl>> idle_;

    std::unique_ptr<httplib::ClientImpl> acquire();
    void release(std::unique_ptr<httplib::ClientImpl> cli);
    std::unique_ptr<httplib::ClientImpl> make_client() const;

public:
    explicit UpstreamClient(const std::string& url, UpstreamOptions opts = UpstreamOptions());

    UpstreamClient(const UpstreamClient&) = delete;
    UpstreamClient& operator=(const UpstreamClient&) = delete;

    // Response id is the request's id. Throws
    // Error(forwarded_request_failed) on transport or decode failure.
    Response forward(const Request& req);

    const UpstreamUrl& url() const { return url_; }
    size_t idle_count();
};

} // namespace gm
