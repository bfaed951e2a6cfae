//
// healthd - Configuration Loading
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef HEALTHD_CONFIG_CONFIG_H
#define HEALTHD_CONFIG_CONFIG_H

#include <core/types.h>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace healthd {

    inline constexpr std::uint16_t default_port = 8081;
    inline constexpr char const* default_bind_address = "0.0.0.0";

    // Environment variable naming the listening port
    inline constexpr char const* port_env_var = "PORT";

    // Environment variable naming an optional TOML config file
    inline constexpr char const* config_env_var = "HEALTHD_CONFIG";

    struct ServerConfig {
        std::string bind_address{default_bind_address};
        Port port{default_port};
    };

    //
    // Top-level configuration structure.
    //
    struct Config {
        ServerConfig server;
    };

    //
    // Parse a port number the way the listener expects it.
    //
    // Surrounding ASCII whitespace and a single leading '+' are accepted.
    // The value must be a decimal integer in 0..65535; 0 binds an
    // ephemeral port.
    //
    // Postconditions:
    //   - On success: returns the port
    //   - On failure: returns error message naming the rejected text
    //
    [[nodiscard]] auto parse_port(std::string_view text)
        -> std::expected<Port, std::string>;

    //
    // Load configuration from a TOML file.
    //
    // Preconditions:
    //   - path must refer to a valid TOML file
    //
    // Postconditions:
    //   - On success: returns parsed and validated Config
    //   - On failure: returns error message describing the failure
    //
    [[nodiscard]] auto load_config(std::filesystem::path const& path)
        -> std::expected<Config, std::string>;

    //
    // Build the effective configuration.
    //
    // Defaults are overlaid by the TOML file at config_path (if given) and
    // then by port_value (the raw PORT environment value, if set).
    //
    [[nodiscard]] auto resolve_config(std::optional<std::filesystem::path> const& config_path,
                                      std::optional<std::string> const& port_value)
        -> std::expected<Config, std::string>;

    //
    // resolve_config() fed from the process environment
    // (HEALTHD_CONFIG and PORT).
    //
    [[nodiscard]] auto load_config_from_environment()
        -> std::expected<Config, std::string>;

}  // namespace healthd

#endif  // HEALTHD_CONFIG_CONFIG_H
