// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#pragma once

#include <core/types.h>

#include <string>
#include <string_view>

namespace healthd::api {

inline constexpr const char* json_content_type = "application/json";

/// Response produced by a handler, written verbatim by the HTTP server
struct ApiResponse {
    HttpStatus status;
    std::string body;
};

/// Health check endpoint handlers
class HealthHandler {
public:
    /// Route a request by method and raw target (path plus any query).
    /// Only GET /health succeeds; everything else is not_found.
    static ApiResponse handle(std::string_view method, std::string_view target);

    /// Handle GET /health - simple health check
    /// Returns {"status": "ok"}
    static ApiResponse handle_health();

    /// Returns 404 {"error": "not_found"}
    static ApiResponse handle_not_found();
};

} // namespace healthd::api
