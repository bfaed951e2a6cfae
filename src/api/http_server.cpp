// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#include "http_server.h"
#include "handlers/health_handler.h"

#include <httplib.h>
#include <systemd/sd-journal.h>

#include <format>
#include <string>
#include <utility>

namespace healthd::api {

namespace {

// Methods with a handler list in httplib::Server; these read the request body
// before the handler runs. Everything else is answered from pre-routing.
bool has_method_routes(const std::string& method) {
    return method == "GET" || method == "HEAD" || method == "POST" || method == "PUT" ||
           method == "PATCH" || method == "DELETE" || method == "OPTIONS";
}

void dispatch(const httplib::Request& req, httplib::Response& res) {
    auto response = HealthHandler::handle(req.method, req.target);
    res.status = to_int(response.status);
    res.set_content(response.body, json_content_type);
}

} // anonymous namespace

HttpServer::HttpServer(ServerConfig config)
    : config_(std::move(config)),
      server_(std::make_unique<httplib::Server>()) {
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::setup_routes() {
    // Every path on every method goes through the same handler, which
    // decides between /health and not_found. No access logger is set.
    const char* any_path = ".*";
    server_->Get(any_path, dispatch);
    server_->Post(any_path, dispatch);
    server_->Put(any_path, dispatch);
    server_->Patch(any_path, dispatch);
    server_->Delete(any_path, dispatch);
    server_->Options(any_path, dispatch);

    // TRACE, CONNECT and PRI parse fine but have no handler list
    server_->set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        if (has_method_routes(req.method)) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        dispatch(req, res);
        return httplib::Server::HandlerResponse::Handled;
    });
}

std::expected<void, std::string> HttpServer::start() {
    const auto& host = config_.bind_address;

    if (*config_.port == 0) {
        int bound = server_->bind_to_any_port(host);
        if (bound < 0) {
            return std::unexpected(std::format("Failed to bind {}:<any>", host));
        }
        bound_port_ = static_cast<std::uint16_t>(bound);
    } else {
        if (!server_->bind_to_port(host, *config_.port)) {
            return std::unexpected(std::format("Failed to bind {}:{}", host, *config_.port));
        }
        bound_port_ = *config_.port;
    }

    sd_journal_print(LOG_INFO, "healthd: Listening on %s:%u",
                     host.c_str(), static_cast<unsigned>(bound_port_.load()));

    if (stop_requested_) {
        return {};
    }

    if (!server_->listen_after_bind()) {
        return std::unexpected(std::format("Accept loop on {}:{} terminated abnormally",
                                           host, bound_port_.load()));
    }
    return {};
}

void HttpServer::stop() {
    stop_requested_ = true;
    if (!server_) {
        return;
    }
    if (server_->is_running()) {
        sd_journal_print(LOG_INFO, "healthd: Stopping HTTP server");
    }
    server_->stop();
}

bool HttpServer::is_running() const {
    return server_ && server_->is_running();
}

} // namespace healthd::api
