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

#include <cstdlib>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "gm/error.hpp"
#include "gm/upstream.hpp"
#include "test_support.hpp"

using gm_test::check;
using json = nlohmann::json;

namespace {

bool bad_url(const std::string& url) {
    try {
        gm::parse_upstream_url(url);
    } catch (const gm::Error& e) {
        return check(e.kind() == gm::ErrorKind::invalid_upstream_url, "kind for " + url);
    }
    return check(false, "accepted " + url);
}

bool test_url_parsing() {
    auto a = gm::parse_upstream_url("http://127.0.0.1:8545");
    auto b = gm::parse_upstream_url("https://eth-mainnet.g.alchemy.com/v2/key");
    auto c = gm::parse_upstream_url("http://localhost/rpc/x");
    return check(!a.ssl && a.host == "127.0.0.1" && a.port == 8545 && a.path == "/", "plain with port") &&
           check(b.ssl && b.host == "eth-mainnet.g.alchemy.com" && b.port == 443 && b.path == "/v2/key", "https default port") &&
           check(c.port == 80 && c.path == "/rpc/x", "http default port") &&
           check(a.to_string() == "http://127.0.0.1:8545/", "to_string") &&
           bad_url("ws://127.0.0.1:8546") && bad_url("127.0.0.1:8545") &&
           bad_url("http://host:abc/") && bad_url("http://host:70000/") && bad_url("http:///path");
}

gm::Request make_request(const std::string& method, gm::Id id) {
    gm::Request req;
    req.method = method;
    req.params = json::array({"latest", false});
    req.id = id;
    return req;
}

bool test_forward() {
    json seen;
    gm_test::FakeUpstream node([&seen](const json& req) {
        seen = req;
        return json{{"jsonrpc", "2.0"}, {"result", "0xaa36a7"}, {"id", 999}};
    });
    gm::UpstreamClient client(node.url());
    auto resp = client.forward(make_request("eth_chainId", gm::Id::from_string("c-2")));
    return check(!resp.payload.is_error() && resp.payload.result == "0xaa36a7", "upstream result relayed") &&
           check(resp.id == gm::Id::from_string("c-2"), "request id kept over upstream id") &&
           check(seen["method"] == "eth_chainId" && seen["params"] == json::array({"latest", false}) &&
                 seen["jsonrpc"] == "2.0" && seen["id"] == "c-2", "body is the re-serialised request") &&
           check(client.idle_count() == 1, "connection returned to pool");
}

bool test_forward_reuses_client() {
    gm_test::FakeUpstream node(gm_test::echo_method);
    gm::UpstreamClient client(node.url());
    for (int i = 0; i < 5; i++) {
        auto resp = client.forward(make_request("eth_blockNumber", gm::Id::from_number(i)));
        if (!check(resp.payload.result == "eth_blockNumber:ok", "echo result")) return false;
    }
    return check(client.idle_count() == 1, "sequential calls share one pooled client") &&
           check(node.hits == 5, "all calls reached upstream");
}

bool test_upstream_error_payload() {
    gm_test::FakeUpstream node([](const json& req) {
        return json{{"jsonrpc", "2.0"},
                    {"error", {{"code", -32000}, {"message", "execution reverted"}}},
                    {"id", req.at("id")}};
    });
    gm::UpstreamClient client(node.url());
    auto resp = client.forward(make_request("eth_call", gm::Id::from_number(3)));
    return check(resp.payload.is_error() && resp.payload.error->code == -32000 &&
                 resp.payload.error->message == "execution reverted", "upstream error relayed unchanged");
}

bool test_forward_failures() {
    gm_test::FakeUpstream node(gm_test::echo_method);
    gm::UpstreamClient garbage(node.url("/garbage"));
    try {
        garbage.forward(make_request("eth_call", gm::Id::from_number(1)));
        return check(false, "html reply accepted");
    } catch (const gm::Error& e) {
        if (!check(e.kind() == gm::ErrorKind::forwarded_request_failed, "html reply kind") ||
            !check(std::string(e.what()).find("502") != std::string::npos, "status in message"))
            return false;
    }

    gm::UpstreamOptions opts;
    opts.timeout_sec = 2;
    gm::UpstreamClient refused("http://127.0.0.1:1", opts);
    try {
        refused.forward(make_request("eth_call", gm::Id::from_number(1)));
        return check(false, "unreachable upstream succeeded");
    } catch (const gm::Error& e) {
        return check(e.kind() == gm::ErrorKind::forwarded_request_failed, "transport failure kind") &&
               check(refused.idle_count() == 0, "failed connection not pooled");
    }
}

} // namespace

int main() {
    try {
        if (!test_url_parsing()) return EXIT_FAILURE;
        if (!test_forward()) return EXIT_FAILURE;
        if (!test_forward_reuses_client()) return EXIT_FAILURE;
        if (!test_upstream_error_payload()) return EXIT_FAILURE;
        if (!test_forward_failures()) return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "unexpected exception: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
