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

#include "gm/server.hpp"
#include "gm/error.hpp"
#include "gm/log.hpp"

namespace gm {

Server::Server(ServeOptions opts, OverrideFn overrider)
    : opts_(std::move(opts)),
      route_("/" + opts_.secret),
      upstream_(std::make_shared<UpstreamClient>(
          opts_.upstream_url,
          UpstreamOptions{opts_.upstream_timeout_sec, opts_.verify_upstream_tls,
                          static_cast<size_t>(opts_.worker_threads > 0 ? opts_.worker_threads : 1)})),
      dispatcher_(std::move(overrider), upstream_, opts_.async_timeout) {
    setup_routes();
}

Server::~Server() {
    stop();
}

void Server::setup_routes() {
    // each blocked async wait holds a worker
    size_t workers = opts_.worker_threads > 0 ? static_cast<size_t>(opts_.worker_threads) : 1;
    svr_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    // a second listener on the same port must fail to bind
    svr_.set_socket_options([](socket_t sock) {
        int yes = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes));
    });

    svr_.Post(".*", [this](const httplib::Request& req, httplib::Response& res) {
        if (req.path != route_) {
            res.status = 404;
            return;
        }
        CancelFn cancelled;
        if (req.is_connection_closed) cancelled = req.is_connection_closed;
        res.set_content(dispatcher_.handle_body(req.body, cancelled), "application/json");
    });

    auto not_allowed = [this](const httplib::Request& req, httplib::Response& res) {
        if (req.path != route_) {
            res.status = 404;
            return;
        }
        res.status = 405;
        res.set_header("Allow", "POST");
    };
    svr_.Get(".*", not_allowed);
    svr_.Put(".*", not_allowed);
    svr_.Patch(".*", not_allowed);
    svr_.Delete(".*", not_allowed);
    svr_.Options(".*", not_allowed);
}

void Server::bind() {
    if (bound_) return;
    if (opts_.port < 0 || opts_.port > 65535)
        throw Error(ErrorKind::port_binding_failed,
                    "Failed to bind to port " + std::to_string(opts_.port) + ". (Error: port out of range)");
    if (opts_.port == 0) {
        int p = svr_.bind_to_any_port(opts_.bind_host);
        if (p < 0) {
            GM_LOG_ERROR("server", "bind %s:0 failed", opts_.bind_host.c_str());
            throw Error(ErrorKind::port_binding_failed,
                        "Failed to bind to port 0 on " + opts_.bind_host + ".");
        }
        port_ = p;
    } else {
        if (!svr_.bind_to_port(opts_.bind_host, opts_.port)) {
            GM_LOG_ERROR("server", "bind %s:%d failed", opts_.bind_host.c_str(), opts_.port);
            throw Error(ErrorKind::port_binding_failed,
                        "Failed to bind to port " + std::to_string(opts_.port) + " on " + opts_.bind_host +
                        ". (Error: address in use or permission denied)");
        }
        port_ = opts_.port;
    }
    bound_ = true;
}

void Server::run() {
    if (!bound_) bind();
    {
        std::lock_guard<std::mutex> lock(run_mtx_);
        if (stopping_) return;
        in_run_ = true;
    }
    GM_LOG_INFO("server", "listening on %s:%d, forwarding to %s",
                opts_.bind_host.c_str(), port_, upstream_->url().to_string().c_str());
    bool ok = svr_.listen_after_bind();
    {
        std::lock_guard<std::mutex> lock(run_mtx_);
        in_run_ = false;
    }
    run_cv_.notify_all();
    if (!ok && !stopping_) {
        GM_LOG_ERROR("server", "accept loop on port %d failed", port_);
        throw Error(ErrorKind::server_crashed, "Server crashed. (Error: accept loop on port " +
                    std::to_string(port_) + " failed)");
    }
    GM_LOG_INFO("server", "port %d stopped", port_);
}

void Server::serve() {
    bind();
    run();
}

void Server::stop() {
    {
        std::unique_lock<std::mutex> lock(run_mtx_);
        stopping_ = true;
        // httplib ignores stop() until the accept loop is up
        while (in_run_ && !svr_.is_running())
            run_cv_.wait_for(lock, std::chrono::milliseconds(10));
    }
    svr_.stop();
}

std::string Server::endpoint(const std::string& host) const {
    return "http://" + host + ":" + std::to_string(port_) + route_;
}

void serve(int port, const std::string& secret, const std::string& upstream_url,
           OverrideFn overrider) {
    ServeOptions opts;
    opts.port = port;
    opts.secret = secret;
    opts.upstream_url = upstream_url;
    Server server(std::move(opts), std::move(overrider));
    server.serve();
}

} // namespace gm
