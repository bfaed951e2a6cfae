// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#include "health_handler.h"

#include <api/serialization/json.h>

namespace healthd::api {

ApiResponse HealthHandler::handle(std::string_view method, std::string_view target) {
    if (method == "GET" && target == "/health") {
        return handle_health();
    }
    return handle_not_found();
}

ApiResponse HealthHandler::handle_health() {
    return {HttpStatus::ok, json::to_json({{"status", "ok"}})};
}

ApiResponse HealthHandler::handle_not_found() {
    return {HttpStatus::not_found, json::error_response("not_found")};
}

} // namespace healthd::api
