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

#include "gm/upstream.hpp"
#include <stdexcept>
#include "gm/codec.hpp"
#include "gm/error.hpp"
#include "gm/log.hpp"

namespace gm {

std::string UpstreamUrl::to_string() const {
    return std::string(ssl ? "https://" : "http://") + host + ":" + std::to_string(port) + path;
}

UpstreamUrl parse_upstream_url(const std::string& url) {
    UpstreamUrl out;
    std::string u = url;
    if (u.rfind("https://", 0) == 0) {
        out.ssl = true;
        out.port = 443;
        u = u.substr(8);
    } else if (u.rfind("http://", 0) == 0) {
        u = u.substr(7);
    } else {
        throw Error(ErrorKind::invalid_upstream_url, "upstream url must start with http:// or https://: " + url);
    }
    auto slash = u.find('/');
    if (slash != std::string::npos) {
        out.path = u.substr(slash);
        out.host = u.substr(0, slash);
    } else {
        out.host = u;
    }
    auto colon = out.host.rfind(':');
    if (colon != std::string::npos && out.host.find(']', colon) == std::string::npos) {
        std::string p = out.host.substr(colon + 1);
        out.host = out.host.substr(0, colon);
        try {
            size_t used = 0;
            out.port = std::stoi(p, &used);
            if (used != p.size()) throw std::invalid_argument(p);
        } catch (const std::exception&) {
            throw Error(ErrorKind::invalid_upstream_url, "invalid port in upstream url: " + url);
        }
        if (out.port <= 0 || out.port > 65535)
            throw Error(ErrorKind::invalid_upstream_url, "port out of range in upstream url: " + url);
    }
    if (out.host.empty())
        throw Error(ErrorKind::invalid_upstream_url, "missing host in upstream url: " + url);
    return out;
}

UpstreamClient::UpstreamClient(const std::string& url, UpstreamOptions opts)
    : url_(parse_upstream_url(url)), opts_(opts) {}

std::unique_ptr<httplib::ClientImpl> UpstreamClient::make_client() const {
    std::unique_ptr<httplib::ClientImpl> cli;
    if (url_.ssl) {
        auto ssl = std::make_unique<httplib::SSLClient>(url_.host, url_.port);
        ssl->enable_server_certificate_verification(opts_.verify_tls);
        cli = std::move(ssl);
    } else {
        cli = std::make_unique<httplib::ClientImpl>(url_.host, url_.port);
    }
    cli->set_keep_alive(true);
    cli->set_connection_timeout(opts_.timeout_sec, 0);
    cli->set_read_timeout(opts_.timeout_sec, 0);
    cli->set_write_timeout(opts_.timeout_sec, 0);
    return cli;
}

std::unique_ptr<httplib::ClientImpl> UpstreamClient::acquire() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!idle_.empty()) {
            auto cli = std::move(idle_.back());
            idle_.pop_back();
            return cli;
        }
    }
    return make_client();
}

void UpstreamClient::release(std::unique_ptr<httplib::ClientImpl> cli) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (idle_.size() < opts_.max_idle) idle_.push_back(std::move(cli));
}

size_t UpstreamClient::idle_count() {
    std::lock_guard<std::mutex> lock(mtx_);
    return idle_.size();
}

Response UpstreamClient::forward(const Request& req) {
    std::string body = dump_json(to_json(req));
    httplib::Headers hdrs = {{"Accept", "application/json"}};

    auto cli = acquire();
    auto res = cli->Post(url_.path, hdrs, body, "application/json");
    if (!res) {
        // the connection is in an unknown state, do not pool it
        throw Error(ErrorKind::forwarded_request_failed,
                    "Forwarded RPC call failed. (Error: " + httplib::to_string(res.error()) + ")");
    }
    int status = res->status;
    std::string reply = std::move(res->body);
    release(std::move(cli));

    Response out;
    try {
        out = response_from_json(nlohmann::json::parse(reply));
    } catch (const std::exception& e) {
        GM_LOG_DEBUG("upstream", "undecodable reply (HTTP %d): %.200s", status, reply.c_str());
        throw Error(ErrorKind::forwarded_request_failed,
                    "Forwarded RPC call failed. (Error: HTTP " + std::to_string(status) +
                    ", invalid JSON-RPC response: " + e.what() + ")");
    }
    out.id = req.id;
    return out;
}

} // namespace gm
