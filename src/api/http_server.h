// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#pragma once

#include <config/config.h>

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

// Forward declare httplib::Server to avoid including the header in this file
namespace httplib {
class Server;
}

namespace healthd::api {

/// HTTP server that answers every request through HealthHandler
class HttpServer {
public:
    explicit HttpServer(ServerConfig config);
    ~HttpServer();

    // Non-copyable, non-movable (contains httplib::Server with active socket)
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    /// Bind to the configured address and serve (blocking call).
    /// Port 0 binds an ephemeral port; see port().
    /// Returns an error if the listener could not be bound.
    [[nodiscard]] std::expected<void, std::string> start();

    /// Stop the accept loop; start() returns afterwards. A stop that lands
    /// before the accept loop is entered makes start() return after binding.
    void stop();

    /// True while the accept loop is running
    bool is_running() const;

    /// Port actually bound, 0 before start() has bound the listener
    std::uint16_t port() const { return bound_port_.load(); }

private:
    ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<std::uint16_t> bound_port_{0};
    std::atomic<bool> stop_requested_{false};

    void setup_routes();
};

} // namespace healthd::api
