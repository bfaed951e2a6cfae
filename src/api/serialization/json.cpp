// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#include "json.h"

#include <format>
#include <sstream>

namespace healthd::api::json {

std::string escape(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\b':
            oss << "\\b";
            break;
        case '\f':
            oss << "\\f";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                // Control characters
                oss << std::format("\\u{:04x}", static_cast<unsigned char>(c));
            } else {
                oss << c;
            }
            break;
        }
    }
    return oss.str();
}

std::string to_json(const Object& object) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : object) {
        if (!first) {
            oss << ", ";
        }
        first = false;
        oss << "\"" << escape(key) << "\": \"" << escape(value) << "\"";
    }
    oss << "}";
    return oss.str();
}

std::string error_response(const std::string& code) {
    return to_json({{"error", code}});
}

} // namespace healthd::api::json
