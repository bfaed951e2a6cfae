// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#pragma once

#include <map>
#include <string>

namespace healthd::api::json {

/// Flat JSON object of string members, serialized in key order
using Object = std::map<std::string, std::string>;

/// Escape a string for JSON (handles quotes, backslashes, control characters)
std::string escape(const std::string& str);

/// Serialize a flat object as {"key": "value", ...}
std::string to_json(const Object& object);

/// Create an error response: {"error": "<code>"}
std::string error_response(const std::string& code);

} // namespace healthd::api::json
