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
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#ifdef _WIN32
#include <direct.h>
#else
#include <sys/stat.h>
#endif
#include <nlohmann/json.hpp>
#include "gm/error.hpp"
#include "gm/log.hpp"

namespace gm {

constexpr const char* DATA_DIR = "data";
constexpr const char* NETWORKS_FILE = "data/networks.json";
constexpr const char* ALCHEMY_KEY_ENV = "GM_ALCHEMY_API_KEY";
constexpr int FIRST_RPC_PORT = 9393;

struct Network {
    std::string name;
    uint32_t chain_id = 0;
    std::string rpc_url;
    std::string rpc_alchemy;   // "{}" is replaced by the api key
    int rpc_port = 0;          // 0: next free slot from FIRST_RPC_PORT

    std::string get_rpc(const std::string& alchemy_key) const {
        if (!rpc_url.empty()) return rpc_url;
        if (!rpc_alchemy.empty()) {
            if (alchemy_key.empty())
                throw Error(ErrorKind::config_failed, "alchemy api key not set for network " + name);
            std::string url = rpc_alchemy;
            auto pos = url.find("{}");
            if (pos != std::string::npos) url.replace(pos, 2, alchemy_key);
            return url;
        }
        throw Error(ErrorKind::config_failed,
                    "no rpc url for network " + name + " (chain_id: " + std::to_string(chain_id) + ")");
    }
};

struct NetworkStore {
    std::vector<Network> networks;
    std::string alchemy_api_key;

    static NetworkStore defaults() {
        NetworkStore s;
        s.networks = {
            {"Mainnet", 1, "", "https://eth-mainnet.g.alchemy.com/v2/{}", 0},
            {"Arbitrum", 42161, "", "https://arb-mainnet.g.alchemy.com/v2/{}", 0},
            {"Optimism", 10, "", "https://opt-mainnet.g.alchemy.com/v2/{}", 0},
            {"Base", 8453, "", "https://base-mainnet.g.alchemy.com/v2/{}", 0},
            {"Polygon", 137, "", "https://polygon-mainnet.g.alchemy.com/v2/{}", 0},
            {"Sepolia", 11155111, "", "https://eth-sepolia.g.alchemy.com/v2/{}", 0},
        };
        return s;
    }

    static NetworkStore from_json(const nlohmann::json& j) {
        NetworkStore s;
        try {
            s.alchemy_api_key = j.value("alchemy_api_key", "");
            for (const auto& n : j.at("networks")) {
                Network net;
                net.name = n.at("name").get<std::string>();
                net.chain_id = n.value("chain_id", 0u);
                net.rpc_url = n.value("rpc_url", "");
                net.rpc_alchemy = n.value("rpc_alchemy", "");
                net.rpc_port = n.value("rpc_port", 0);
                if (net.rpc_port < 0 || net.rpc_port > 65535)
                    throw Error(ErrorKind::config_failed, "rpc_port out of range for network " + net.name);
                s.networks.push_back(net);
            }
        } catch (const nlohmann::json::exception& e) {
            throw Error(ErrorKind::config_failed, std::string("invalid networks file: ") + e.what());
        }
        return s;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        if (!alchemy_api_key.empty()) j["alchemy_api_key"] = alchemy_api_key;
        j["networks"] = nlohmann::json::array();
        for (const auto& n : networks) {
            nlohmann::json e;
            e["name"] = n.name;
            e["chain_id"] = n.chain_id;
            if (!n.rpc_url.empty()) e["rpc_url"] = n.rpc_url;
            if (!n.rpc_alchemy.empty()) e["rpc_alchemy"] = n.rpc_alchemy;
            if (n.rpc_port > 0) e["rpc_port"] = n.rpc_port;
            j["networks"].push_back(e);
        }
        return j;
    }

    // A missing file gives the built-in list.
    static NetworkStore load(const std::string& path) {
        std::ifstream f(path);
        if (!f) return defaults();
        nlohmann::json j;
        try {
            f >> j;
        } catch (const nlohmann::json::exception& e) {
            throw Error(ErrorKind::config_failed, "cannot parse " + path + ": " + e.what());
        }
        return from_json(j);
    }

    void save(const std::string& path) const {
        ensure_data_dir();
        std::ofstream f(path);
        if (!f) throw Error(ErrorKind::config_failed, "cannot write " + path);
        f << to_json().dump(2) << "\n";
    }

    std::string effective_alchemy_key() const {
        const char* env = std::getenv(ALCHEMY_KEY_ENV);
        if (env && *env) return env;
        return alchemy_api_key;
    }

    static void ensure_data_dir() {
#ifdef _WIN32
        _mkdir(DATA_DIR);
#else
        struct stat st;
        if (stat(DATA_DIR, &st) != 0) {
            mkdir(DATA_DIR, 0700);
        }
#endif
    }
};

// "Arbitrum Sepolia" -> "ARBITRUM_SEPOLIA_RPC_URL"
inline std::string rpc_env_var_name(const std::string& network_name) {
    std::string s;
    for (char c : network_name)
        s += c == ' ' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s + "_RPC_URL";
}

struct ProxyPlan {
    std::string network;
    std::string upstream_url;
    int port;
};

// One proxy per network. Networks without a usable rpc are skipped but
// still consume a port slot.
inline std::vector<ProxyPlan> plan_proxies(const NetworkStore& store) {
    std::vector<ProxyPlan> plans;
    std::string key = store.effective_alchemy_key();
    int port = FIRST_RPC_PORT;
    for (const auto& n : store.networks) {
        int actual = n.rpc_port > 0 ? n.rpc_port : port;
        port++;
        try {
            plans.push_back({n.name, n.get_rpc(key), actual});
        } catch (const Error& e) {
            GM_LOG_WARN("config", "skipping %s: %s", n.name.c_str(), e.what());
        }
    }
    return plans;
}

} // namespace gm
