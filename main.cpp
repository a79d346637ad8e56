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
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#ifdef _WIN32
#define NOMINMAX
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif
#endif

#include <nlohmann/json.hpp>

#include "gm/codec.hpp"
#include "gm/error.hpp"
#include "gm/log.hpp"
#include "gm/server.hpp"
#include "approval_queue.hpp"
#include "network_store.hpp"
#include "secret.hpp"

using json = nlohmann::json;

static std::string g_secret;

static void handle_signal(int) {
    gm::secure_zero(g_secret);
#ifdef _WIN32
    ExitProcess(0);
#else
    _exit(0);
#endif
}

struct Options {
    std::string config = gm::NETWORKS_FILE;
    std::string account;
    std::string bind_host = "127.0.0.1";
    std::string upstream;
    std::string name = "Local";
    std::string secret;
    int port = gm::FIRST_RPC_PORT;
    bool init_config = false;
};

struct RunningProxy {
    std::string network;
    std::unique_ptr<gm::Server> server;
    std::thread thread;
};

static void usage() {
    printf("usage: gm_devrpc [options]\n"
           "  --config <path>      networks file (default %s)\n"
           "  --init-config        write the built-in networks to --config and exit\n"
           "  --account <address>  account returned by eth_accounts\n"
           "  --bind <host>        listen address (default 127.0.0.1)\n"
           "  --upstream <url>     single network mode, forward to this rpc\n"
           "  --port <n>           port in single network mode (default %d)\n"
           "  --name <name>        network name in single network mode\n"
           "  --secret <s>         url path secret (default: random)\n"
           "  --log-level <level>  debug, info, warn, error or off\n",
           gm::NETWORKS_FILE, gm::FIRST_RPC_PORT);
}

static void print_console_help() {
    printf("commands:\n"
           "  list                  pending requests\n"
           "  approve <n> <json>    reply to request n with a result\n"
           "  reject <n>            reply to request n with user rejected\n"
           "  urls                  rpc urls per network\n"
           "  stats                 proxy counters\n"
           "  quit\n");
}

static bool parse_args(int argc, char** argv, Options& o) {
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        auto next = [&](std::string& dst) {
            if (i + 1 >= argc) {
                fprintf(stderr, "missing value for %s\n", a.c_str());
                return false;
            }
            dst = argv[++i];
            return true;
        };
        std::string v;
        if (a == "--help" || a == "-h") {
            usage();
            exit(0);
        } else if (a == "--config") {
            if (!next(o.config)) return false;
        } else if (a == "--init-config") {
            o.init_config = true;
        } else if (a == "--account") {
            if (!next(o.account)) return false;
        } else if (a == "--bind") {
            if (!next(o.bind_host)) return false;
        } else if (a == "--upstream") {
            if (!next(o.upstream)) return false;
        } else if (a == "--name") {
            if (!next(o.name)) return false;
        } else if (a == "--secret") {
            if (!next(o.secret)) return false;
        } else if (a == "--port") {
            if (!next(v)) return false;
            o.port = atoi(v.c_str());
            if (o.port <= 0 || o.port > 65535) {
                fprintf(stderr, "invalid port: %s\n", v.c_str());
                return false;
            }
        } else if (a == "--log-level") {
            if (!next(v)) return false;
            gm::LogLevel level;
            if (!gm::parse_log_level(v, level)) {
                fprintf(stderr, "invalid log level: %s\n", v.c_str());
                return false;
            }
            gm::set_log_level(level);
        } else {
            fprintf(stderr, "unknown option: %s\n", a.c_str());
            return false;
        }
    }
    return true;
}

static void print_pending(const gm::PendingSummary& p) {
    printf("[%llu] %s %s %s%s\n", (unsigned long long)p.seq, p.network.c_str(),
           p.method.c_str(), gm::dump_json(p.params).c_str(),
           p.client_gone ? " (client gone)" : "");
}

static void print_urls(const std::vector<RunningProxy>& proxies) {
    for (const auto& p : proxies)
        printf("export %s=%s\n", gm::rpc_env_var_name(p.network).c_str(),
               p.server->endpoint().c_str());
    fflush(stdout);
}

static bool parse_seq(std::istringstream& in, uint64_t& seq) {
    unsigned long long n = 0;
    if (!(in >> n)) {
        printf("expected a request number\n");
        return false;
    }
    seq = n;
    return true;
}

static void report(gm::Resolution r, uint64_t seq) {
    switch (r) {
        case gm::Resolution::delivered:
            printf("[%llu] replied\n", (unsigned long long)seq);
            break;
        case gm::Resolution::not_found:
            printf("[%llu] no such request\n", (unsigned long long)seq);
            break;
        case gm::Resolution::client_gone:
            printf("[%llu] client is gone, reply discarded\n", (unsigned long long)seq);
            break;
    }
}

static void console_loop(gm::ApprovalQueue& queue, const std::vector<RunningProxy>& proxies) {
    std::string line;
    printf("> ");
    fflush(stdout);
    while (std::getline(std::cin, line)) {
        for (uint64_t seq : queue.prune_closed())
            printf("[%llu] abandoned by client\n", (unsigned long long)seq);

        std::istringstream in(line);
        std::string cmd;
        in >> cmd;
        if (cmd.empty()) {
        } else if (cmd == "quit" || cmd == "exit") {
            break;
        } else if (cmd == "help") {
            print_console_help();
        } else if (cmd == "list") {
            auto pending = queue.list();
            if (pending.empty()) printf("no pending requests\n");
            for (const auto& p : pending) print_pending(p);
        } else if (cmd == "approve") {
            uint64_t seq;
            if (parse_seq(in, seq)) {
                std::string rest;
                std::getline(in, rest);
                try {
                    report(queue.approve(seq, json::parse(rest)), seq);
                } catch (const json::parse_error& e) {
                    printf("invalid json result: %s\n", e.what());
                }
            }
        } else if (cmd == "reject") {
            uint64_t seq;
            if (parse_seq(in, seq)) report(queue.reject(seq), seq);
        } else if (cmd == "urls") {
            print_urls(proxies);
        } else if (cmd == "stats") {
            for (const auto& p : proxies)
                printf("%s %s\n", p.network.c_str(), p.server->stats().to_json().dump().c_str());
        } else {
            printf("unknown command: %s (try help)\n", cmd.c_str());
        }
        printf("> ");
        fflush(stdout);
    }
}

int main(int argc, char** argv) {
#ifdef _WIN32
    SetConsoleCtrlHandler([](DWORD) -> BOOL {
        handle_signal(0);
        return TRUE;
    }, TRUE);
#else
    struct rlimit rl = {0, 0};
    setrlimit(RLIMIT_CORE, &rl);
#ifdef __linux__
    prctl(PR_SET_DUMPABLE, 0);
#endif
    signal(SIGTERM, handle_signal);
    signal(SIGINT, handle_signal);
#endif

    Options opts;
    if (!parse_args(argc, argv, opts)) {
        usage();
        return 2;
    }

    std::vector<gm::ProxyPlan> plans;
    try {
        if (opts.init_config) {
            gm::NetworkStore::defaults().save(opts.config);
            printf("wrote %s\n", opts.config.c_str());
            return 0;
        }
        if (!opts.upstream.empty()) {
            plans.push_back({opts.name, opts.upstream, opts.port});
        } else {
            plans = gm::plan_proxies(gm::NetworkStore::load(opts.config));
        }
        g_secret = opts.secret.empty() ? gm::random_secret_hex() : opts.secret;
    } catch (const std::exception& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    if (plans.empty()) {
        fprintf(stderr, "no network has a usable rpc url (set %s or use --upstream)\n",
                gm::ALCHEMY_KEY_ENV);
        return 1;
    }

    gm::ApprovalQueue queue;
    queue.set_on_push([](const gm::PendingSummary& p) {
        printf("\nawaiting approval: ");
        print_pending(p);
        printf("> ");
        fflush(stdout);
    });

    std::vector<RunningProxy> proxies;
    for (const auto& plan : plans) {
        gm::ServeOptions so;
        so.bind_host = opts.bind_host;
        so.port = plan.port;
        so.secret = g_secret;
        so.upstream_url = plan.upstream_url;
        try {
            RunningProxy p;
            p.network = plan.network;
            p.server = std::make_unique<gm::Server>(
                so, gm::make_wallet_override(queue, plan.network, opts.account));
            p.server->bind();
            proxies.push_back(std::move(p));
        } catch (const gm::Error& e) {
            fprintf(stderr, "%s: %s\n", plan.network.c_str(), e.what());
        }
    }
    if (proxies.empty()) return 1;

    for (auto& p : proxies) {
        gm::Server* server = p.server.get();
        std::string network = p.network;
        p.thread = std::thread([server, network] {
            try {
                server->run();
            } catch (const gm::Error& e) {
                fprintf(stderr, "rpc proxy for %s crashed: %s\n", network.c_str(), e.what());
            }
        });
    }

    for (auto& p : proxies) p.server->wait_until_ready();

    print_urls(proxies);
    printf("gm_devrpc ready, %zu network(s). type help for commands\n", proxies.size());
    console_loop(queue, proxies);

    queue.clear();
    for (auto& p : proxies) p.server->stop();
    for (auto& p : proxies) {
        if (p.thread.joinable()) p.thread.join();
        fprintf(stderr, "%s %s\n", p.network.c_str(), p.server->stats().to_json().dump().c_str());
    }
    gm::secure_zero(g_secret);
    return 0;
}
