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

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "network_store.hpp"
#include "test_support.hpp"

using gm_test::check;
using gm_test::parse;
using json = nlohmann::json;

namespace {

std::string temp_path(const std::string& name) {
    const char* dir = std::getenv("TMPDIR");
    return std::string(dir && *dir ? dir : "/tmp") + "/gm_devrpc_" + name;
}

bool test_defaults() {
    auto store = gm::NetworkStore::defaults();
    bool all_alchemy = true;
    for (const auto& n : store.networks)
        all_alchemy = all_alchemy && n.rpc_url.empty() && n.rpc_alchemy.find("{}") != std::string::npos;
    return check(store.networks.size() == 6, "six built-in networks") &&
           check(store.networks[0].name == "Mainnet" && store.networks[0].chain_id == 1, "mainnet first") &&
           check(all_alchemy, "built-ins use the alchemy template");
}

bool test_from_json() {
    auto store = gm::NetworkStore::from_json(parse(R"({
        "alchemy_api_key": "k1",
        "networks": [
            {"name": "Local", "chain_id": 31337, "rpc_url": "http://127.0.0.1:8545", "rpc_port": 9500},
            {"name": "Sepolia", "chain_id": 11155111, "rpc_alchemy": "https://eth-sepolia.g.alchemy.com/v2/{}"}
        ]})"));
    const auto& local = store.networks.at(0);
    const auto& sepolia = store.networks.at(1);
    json again = store.to_json();
    return check(store.alchemy_api_key == "k1", "key read") &&
           check(local.chain_id == 31337 && local.rpc_port == 9500, "local fields") &&
           check(local.get_rpc("") == "http://127.0.0.1:8545", "explicit rpc wins") &&
           check(sepolia.get_rpc("xyz") == "https://eth-sepolia.g.alchemy.com/v2/xyz", "template filled") &&
           check(again["networks"][0]["rpc_port"] == 9500, "port written back") &&
           check(!again["networks"][1].contains("rpc_url"), "empty fields left out");
}

bool test_get_rpc_failures() {
    gm::Network alchemy{"Base", 8453, "", "https://base-mainnet.g.alchemy.com/v2/{}", 0};
    gm::Network empty{"Nowhere", 5, "", "", 0};
    bool missing_key = false, no_rpc = false;
    try {
        alchemy.get_rpc("");
    } catch (const gm::Error& e) {
        missing_key = e.kind() == gm::ErrorKind::config_failed;
    }
    try {
        empty.get_rpc("key");
    } catch (const gm::Error& e) {
        no_rpc = e.kind() == gm::ErrorKind::config_failed &&
                 std::string(e.what()).find("Nowhere") != std::string::npos;
    }
    return check(missing_key, "alchemy without key fails") && check(no_rpc, "network without rpc fails");
}

bool test_env_var_name() {
    return check(gm::rpc_env_var_name("Arbitrum Sepolia") == "ARBITRUM_SEPOLIA_RPC_URL", "two words") &&
           check(gm::rpc_env_var_name("Mainnet") == "MAINNET_RPC_URL", "one word");
}

bool test_plan_proxies() {
    unsetenv(gm::ALCHEMY_KEY_ENV);
    gm::NetworkStore store;
    store.alchemy_api_key = "filekey";
    store.networks = {
        {"Mainnet", 1, "", "https://eth-mainnet.g.alchemy.com/v2/{}", 0},
        {"Broken", 2, "", "", 0},
        {"Local", 31337, "http://127.0.0.1:8545", "", 0},
        {"Pinned", 10, "http://127.0.0.1:9545", "", 9999},
    };
    auto plans = gm::plan_proxies(store);
    if (!check(plans.size() == 3, "broken network skipped")) return false;
    bool ok = check(plans[0].network == "Mainnet" && plans[0].port == 9393, "first port") &&
              check(plans[0].upstream_url == "https://eth-mainnet.g.alchemy.com/v2/filekey", "file key used") &&
              check(plans[1].network == "Local" && plans[1].port == 9395, "skipped slot still consumed") &&
              check(plans[2].port == 9999, "explicit port kept");

    setenv(gm::ALCHEMY_KEY_ENV, "envkey", 1);
    auto with_env = gm::plan_proxies(store);
    unsetenv(gm::ALCHEMY_KEY_ENV);
    return ok && check(with_env[0].upstream_url == "https://eth-mainnet.g.alchemy.com/v2/envkey",
                       "environment key overrides the file");
}

bool test_load() {
    auto missing = gm::NetworkStore::load(temp_path("does_not_exist.json"));

    std::string good = temp_path("networks.json");
    {
        std::ofstream f(good);
        f << R"({"networks":[{"name":"Local","chain_id":31337,"rpc_url":"http://127.0.0.1:8545"}]})";
    }
    auto loaded = gm::NetworkStore::load(good);

    std::string bad = temp_path("broken.json");
    {
        std::ofstream f(bad);
        f << "{\"networks\": [";
    }
    bool bad_failed = false;
    try {
        gm::NetworkStore::load(bad);
    } catch (const gm::Error& e) {
        bad_failed = e.kind() == gm::ErrorKind::config_failed;
    }

    std::string shape = temp_path("shape.json");
    {
        std::ofstream f(shape);
        f << R"({"networks":[{"chain_id":1}]})";
    }
    bool shape_failed = false;
    try {
        gm::NetworkStore::load(shape);
    } catch (const gm::Error& e) {
        shape_failed = e.kind() == gm::ErrorKind::config_failed;
    }
    std::remove(good.c_str());
    std::remove(bad.c_str());
    std::remove(shape.c_str());

    return check(missing.networks.size() == 6, "missing file gives defaults") &&
           check(loaded.networks.size() == 1 && loaded.networks[0].name == "Local", "file read") &&
           check(bad_failed, "unparsable file rejected") &&
           check(shape_failed, "entry without name rejected");
}

} // namespace

int main() {
    try {
        if (!test_defaults()) return EXIT_FAILURE;
        if (!test_from_json()) return EXIT_FAILURE;
        if (!test_get_rpc_failures()) return EXIT_FAILURE;
        if (!test_env_var_name()) return EXIT_FAILURE;
        if (!test_plan_proxies()) return EXIT_FAILURE;
        if (!test_load()) return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "unexpected exception: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
