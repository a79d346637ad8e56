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
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <httplib.h>
#include "gm/dispatcher.hpp"
#include "gm/override.hpp"
#include "gm/stats.hpp"
#include "gm/upstream.hpp"

namespace gm {

struct ServeOptions {
    std::string bind_host = "0.0.0.0";
    int port = 0;
    std::string secret;
    std::string upstream_url;
    int worker_threads = 32;
    int upstream_timeout_sec = 30;
    bool verify_upstream_tls = true;
    std::chrono::milliseconds async_timeout = std::chrono::seconds(ASYNC_REPLY_TIMEOUT_SEC);
};

// JSON-RPC proxy on POST /<secret>. Every other path or method gets a
// plain HTTP 404/405.
class Server {
    ServeOptions opts_;
    std::string route_;
    std::shared_ptr<UpstreamClient> upstream_;
    Dispatcher dispatcher_;
    httplib::Server svr_;
    std::atomic<bool> bound_{false};
    std::atomic<bool> stopping_{false};
    // guards the hand-off between run() entering the accept loop and stop()
    std::mutex run_mtx_;
    std::condition_variable run_cv_;
    bool in_run_ = false;
    int port_ = -1;

    void setup_routes();

public:
    // Throws Error(invalid_upstream_url).
    Server(ServeOptions opts, OverrideFn overrider);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Throws Error(port_binding_failed). Port 0 picks a free port.
    void bind();

    // Blocks until stop(). Throws Error(server_crashed) if the accept loop
    // fails on its own.
    void run();

    // bind() + run().
    void serve();

    // Safe from any thread, before or during run(); a run() that is still
    // starting up returns promptly.
    void stop();

    // For callers that run() on another thread.
    void wait_until_ready() const { svr_.wait_until_ready(); }

    int port() const { return port_; }
    const std::string& route() const { return route_; }
    std::string endpoint(const std::string& host = "localhost") const;
    const ProxyStats& stats() const { return dispatcher_.stats(); }
};

// Binds bind_host 0.0.0.0 and never returns unless startup or the accept
// loop fails.
void serve(int port, const std::string& secret, const std::string& upstream_url,
           OverrideFn overrider);

} // namespace gm
