//
// healthd - Configuration Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <config/config.h>

#include <hinder/exception/exception.h>

#include <toml++/toml.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <utility>

namespace healthd {

    HINDER_DEFINE_EXCEPTION(config_error, hinder::generic_error);

    namespace {

        constexpr std::int64_t max_port = 65535;

        //
        // Extract optional value from TOML table with default.
        //
        template<typename T>
        auto get_or(toml::table const& table, std::string_view key, T default_value) -> T {
            if (auto opt = table[key].value<T>()) {
                return *opt;
            }
            return default_value;
        }

        [[nodiscard]] auto is_space(char c) -> bool {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        [[nodiscard]] auto trim(std::string_view text) -> std::string_view {
            while (!text.empty() && is_space(text.front())) {
                text.remove_prefix(1);
            }
            while (!text.empty() && is_space(text.back())) {
                text.remove_suffix(1);
            }
            return text;
        }

        //
        // Parse ServerConfig section.
        //
        auto parse_server(toml::table const& root) -> ServerConfig {
            ServerConfig cfg;

            if (auto server = root["server"].as_table()) {
                cfg.bind_address = get_or(*server, "bind_address", cfg.bind_address);
                HINDER_EXPECTS(!cfg.bind_address.empty(), config_error)
                    .message("server.bind_address must not be empty");

                if (auto node = (*server)["port"]) {
                    auto port = node.value<std::int64_t>();
                    HINDER_EXPECTS(port.has_value(), config_error)
                        .message("server.port must be an integer");
                    HINDER_EXPECTS(*port >= 0 && *port <= max_port, config_error)
                        .message("server.port out of range: {}", *port);
                    cfg.port = Port{static_cast<std::uint16_t>(*port)};
                }
            }

            return cfg;
        }

    }  // anonymous namespace

    auto parse_port(std::string_view text) -> std::expected<Port, std::string> {
        auto digits = trim(text);
        if (!digits.empty() && digits.front() == '+') {
            digits.remove_prefix(1);
        }

        std::int64_t value = 0;
        auto const* first = digits.data();
        auto const* last = digits.data() + digits.size();
        auto [ptr, ec] = std::from_chars(first, last, value);

        if (digits.empty() || ec != std::errc{} || ptr != last) {
            return std::unexpected(std::format("Invalid port '{}': not an integer", text));
        }
        if (value < 0 || value > max_port) {
            return std::unexpected(std::format("Invalid port '{}': must be in 0..{}", text, max_port));
        }

        return Port{static_cast<std::uint16_t>(value)};
    }

    auto load_config(std::filesystem::path const& path)
        -> std::expected<Config, std::string> {

        try {
            auto toml = toml::parse_file(path.string());

            Config cfg;
            cfg.server = parse_server(toml);

            return cfg;
        }
        catch (toml::parse_error const& e) {
            return std::unexpected(std::format("TOML parse error: {}", e.description()));
        }
        catch (config_error const& e) {
            return std::unexpected(std::format("Config error: {}", e.what()));
        }
        catch (std::exception const& e) {
            return std::unexpected(std::format("Unexpected error loading config: {}", e.what()));
        }
    }

    auto resolve_config(std::optional<std::filesystem::path> const& config_path,
                        std::optional<std::string> const& port_value)
        -> std::expected<Config, std::string> {

        Config cfg;

        if (config_path) {
            auto file_result = load_config(*config_path);
            if (!file_result) {
                return std::unexpected(std::format("Failed to load config {}: {}",
                                                   config_path->string(), file_result.error()));
            }
            cfg = std::move(*file_result);
        }

        // PORT overrides the file
        if (port_value) {
            auto port_result = parse_port(*port_value);
            if (!port_result) {
                return std::unexpected(std::format("{}: {}", port_env_var, port_result.error()));
            }
            cfg.server.port = *port_result;
        }

        return cfg;
    }

    auto load_config_from_environment() -> std::expected<Config, std::string> {
        std::optional<std::filesystem::path> config_path;
        if (char const* value = std::getenv(config_env_var); value != nullptr) {
            config_path = value;
        }

        std::optional<std::string> port_value;
        if (char const* value = std::getenv(port_env_var); value != nullptr) {
            port_value = value;
        }

        return resolve_config(config_path, port_value);
    }

}  // namespace healthd
