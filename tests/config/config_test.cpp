//
// healthd - Config Tests
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <config/config.h>

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace healthd {

    TEST(ConfigTest, DefaultsWithoutFileOrPort) {
        auto cfg_result = resolve_config(std::nullopt, std::nullopt);

        ASSERT_TRUE(cfg_result.has_value());
        auto const& cfg = cfg_result.value();

        EXPECT_EQ(cfg.server.bind_address, "0.0.0.0");
        EXPECT_EQ(*cfg.server.port, 8081);
    }

    TEST(ConfigTest, PortOverridesDefault) {
        auto cfg_result = resolve_config(std::nullopt, std::string{"9999"});

        ASSERT_TRUE(cfg_result.has_value());
        EXPECT_EQ(*cfg_result->server.port, 9999);
        EXPECT_EQ(cfg_result->server.bind_address, "0.0.0.0");
    }

    TEST(ConfigTest, NonNumericPortIsStartupError) {
        auto cfg_result = resolve_config(std::nullopt, std::string{"http"});

        ASSERT_FALSE(cfg_result.has_value());
        EXPECT_NE(cfg_result.error().find("PORT"), std::string::npos);
        EXPECT_NE(cfg_result.error().find("http"), std::string::npos);
    }

    TEST(ConfigTest, EmptyPortIsStartupError) {
        auto cfg_result = resolve_config(std::nullopt, std::string{});
        EXPECT_FALSE(cfg_result.has_value());
    }

    TEST(ConfigTest, ParsePortAcceptsIntegerForms) {
        EXPECT_EQ(*parse_port("1").value(), 1);
        EXPECT_EQ(*parse_port("65535").value(), 65535);
        EXPECT_EQ(*parse_port(" 8080\n").value(), 8080);
        EXPECT_EQ(*parse_port("+443").value(), 443);
        EXPECT_EQ(*parse_port("007").value(), 7);
    }

    TEST(ConfigTest, ParsePortRejectsInvalidText) {
        for (auto text : {"", "   ", "+", "abc", "80x", "8 0", "-1", "1.5", "++80", "0x50"}) {
            EXPECT_FALSE(parse_port(text).has_value()) << "'" << text << "'";
        }
    }

    TEST(ConfigTest, ParsePortAcceptsZeroForEphemeralPort) {
        auto port = parse_port("0");
        ASSERT_TRUE(port.has_value());
        EXPECT_EQ(**port, 0);

        auto cfg_result = resolve_config(std::nullopt, std::string{"0"});
        ASSERT_TRUE(cfg_result.has_value());
        EXPECT_EQ(*cfg_result->server.port, 0);
    }

    TEST(ConfigTest, ParsePortRejectsOutOfRange) {
        EXPECT_FALSE(parse_port("65536").has_value());
        EXPECT_FALSE(parse_port("99999999999999999999").has_value());
    }

    class ConfigFileTest : public ::testing::Test {
    protected:
        void SetUp() override {
            m_path = std::filesystem::temp_directory_path() / "healthd_test_config.toml";
            std::filesystem::remove(m_path);
        }

        void TearDown() override {
            std::filesystem::remove(m_path);
        }

        void write(std::string const& contents) {
            std::ofstream file(m_path);
            file << contents;
        }

        std::filesystem::path m_path;
    };

    TEST_F(ConfigFileTest, LoadValidConfig) {
        write(R"(
[server]
bind_address = "127.0.0.1"
port = 9000
)");

        auto cfg_result = load_config(m_path);
        ASSERT_TRUE(cfg_result.has_value()) << cfg_result.error();

        EXPECT_EQ(cfg_result->server.bind_address, "127.0.0.1");
        EXPECT_EQ(*cfg_result->server.port, 9000);
    }

    TEST_F(ConfigFileTest, MissingSectionKeepsDefaults) {
        write("# nothing here\n");

        auto cfg_result = load_config(m_path);
        ASSERT_TRUE(cfg_result.has_value());

        EXPECT_EQ(cfg_result->server.bind_address, "0.0.0.0");
        EXPECT_EQ(*cfg_result->server.port, 8081);
    }

    TEST_F(ConfigFileTest, InvalidTomlSyntax) {
        write("this is not valid toml [[[");

        auto cfg_result = load_config(m_path);
        ASSERT_FALSE(cfg_result.has_value());
        EXPECT_NE(cfg_result.error().find("parse error"), std::string::npos);
    }

    TEST_F(ConfigFileTest, NonIntegerPortInFile) {
        write(R"(
[server]
port = "8081"
)");

        auto cfg_result = load_config(m_path);
        ASSERT_FALSE(cfg_result.has_value());
        EXPECT_NE(cfg_result.error().find("server.port"), std::string::npos);
    }

    TEST_F(ConfigFileTest, OutOfRangePortInFile) {
        write(R"(
[server]
port = 70000
)");

        auto cfg_result = load_config(m_path);
        ASSERT_FALSE(cfg_result.has_value());
        EXPECT_NE(cfg_result.error().find("out of range"), std::string::npos);
    }

    TEST_F(ConfigFileTest, PortEnvironmentOverridesFile) {
        write(R"(
[server]
bind_address = "127.0.0.1"
port = 9000
)");

        auto cfg_result = resolve_config(m_path, std::string{"9999"});
        ASSERT_TRUE(cfg_result.has_value());

        EXPECT_EQ(cfg_result->server.bind_address, "127.0.0.1");
        EXPECT_EQ(*cfg_result->server.port, 9999);
    }

    TEST_F(ConfigFileTest, MissingFileIsError) {
        auto cfg_result = resolve_config(m_path, std::nullopt);
        ASSERT_FALSE(cfg_result.has_value());
        EXPECT_NE(cfg_result.error().find(m_path.string()), std::string::npos);
    }

    class ConfigEnvironmentTest : public ::testing::Test {
    protected:
        void SetUp() override {
            ::unsetenv(port_env_var);
            ::unsetenv(config_env_var);
        }

        void TearDown() override {
            ::unsetenv(port_env_var);
            ::unsetenv(config_env_var);
        }
    };

    TEST_F(ConfigEnvironmentTest, UnsetPortListensOn8081) {
        auto cfg_result = load_config_from_environment();

        ASSERT_TRUE(cfg_result.has_value());
        EXPECT_EQ(*cfg_result->server.port, 8081);
    }

    TEST_F(ConfigEnvironmentTest, PortFromEnvironment) {
        ::setenv(port_env_var, "9999", 1);

        auto cfg_result = load_config_from_environment();

        ASSERT_TRUE(cfg_result.has_value());
        EXPECT_EQ(*cfg_result->server.port, 9999);
    }

    TEST_F(ConfigEnvironmentTest, InvalidPortFromEnvironment) {
        ::setenv(port_env_var, "not-a-port", 1);

        auto cfg_result = load_config_from_environment();
        EXPECT_FALSE(cfg_result.has_value());
    }

}  // namespace healthd
