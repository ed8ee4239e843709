//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: GoogleTests for environment and argument driven configuration
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "storemcp/Config.h"

using namespace storemcp;

namespace {

const char* const kVars[] = {
    "STOREMCP_ADDRESS", "STOREMCP_PORT", "STOREMCP_SCHEME", "STOREMCP_CERT_FILE", "STOREMCP_KEY_FILE",
    "STOREMCP_THREADS", "STOREMCP_MCP_PATH", "STOREMCP_LOG_LEVEL", "STOREMCP_LOG_FILE",
};

//==========================================================================================================
// Args
// Purpose: Owns argv storage for LoadServerConfig.
//==========================================================================================================
class Args {
public:
    Args(std::initializer_list<std::string> items) : storage{"store-mcp-server"} {
        storage.insert(storage.end(), items.begin(), items.end());
        for (auto& s : storage) ptrs.push_back(s.data());
    }
    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }

private:
    std::vector<std::string> storage;
    std::vector<char*> ptrs;
};

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }
    static void clear() {
        for (const char* v : kVars) ::unsetenv(v);
    }
};

} // namespace

TEST_F(ServerConfigTest, Defaults) {
    Args args{};
    ServerConfig cfg = LoadServerConfig(args.argc(), args.argv());
    EXPECT_EQ(cfg.address, "0.0.0.0");
    EXPECT_EQ(cfg.port, "8080");
    EXPECT_EQ(cfg.scheme, "http");
    EXPECT_EQ(cfg.threads, 4u);
    EXPECT_EQ(cfg.mcpPath, "/mcp");
    EXPECT_EQ(cfg.logLevel, LogLevel::LOG_INFO_LEVEL);
    EXPECT_TRUE(cfg.logFile.empty());
    EXPECT_TRUE(cfg.certFile.empty());
}

TEST_F(ServerConfigTest, EnvironmentThenArguments) {
    ::setenv("STOREMCP_ADDRESS", "127.0.0.1", 1);
    ::setenv("STOREMCP_PORT", "9000", 1);
    ::setenv("STOREMCP_THREADS", "2", 1);
    ::setenv("STOREMCP_LOG_LEVEL", "debug", 1);
    ::setenv("STOREMCP_MCP_PATH", "/rpc", 1);

    Args envOnly{};
    ServerConfig fromEnv = LoadServerConfig(envOnly.argc(), envOnly.argv());
    EXPECT_EQ(fromEnv.address, "127.0.0.1");
    EXPECT_EQ(fromEnv.port, "9000");
    EXPECT_EQ(fromEnv.threads, 2u);
    EXPECT_EQ(fromEnv.logLevel, LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_EQ(fromEnv.mcpPath, "/rpc");

    Args overrides{"--port=9100", "--threads=16", "--log-level=WARN", "--log-file=/tmp/storemcp.log"};
    ServerConfig cfg = LoadServerConfig(overrides.argc(), overrides.argv());
    EXPECT_EQ(cfg.address, "127.0.0.1");
    EXPECT_EQ(cfg.port, "9100");
    EXPECT_EQ(cfg.threads, 16u);
    EXPECT_EQ(cfg.logLevel, LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(cfg.logFile, "/tmp/storemcp.log");
}

TEST_F(ServerConfigTest, EmptyEnvironmentFallsBackToDefault) {
    ::setenv("STOREMCP_PORT", "", 1);
    Args args{};
    EXPECT_EQ(LoadServerConfig(args.argc(), args.argv()).port, "8080");
}

TEST_F(ServerConfigTest, HttpsRequiresCertAndKey) {
    Args missing{"--scheme=HTTPS"};
    EXPECT_THROW(LoadServerConfig(missing.argc(), missing.argv()), std::invalid_argument);

    Args full{"--scheme=https", "--cert=/certs/cert.pem", "--key=/certs/key.pem"};
    ServerConfig cfg = LoadServerConfig(full.argc(), full.argv());
    EXPECT_EQ(cfg.scheme, "https");
    EXPECT_EQ(cfg.certFile, "/certs/cert.pem");
    EXPECT_EQ(cfg.keyFile, "/certs/key.pem");
}

TEST_F(ServerConfigTest, RejectsInvalidValues) {
    const std::vector<std::string> bad = {
        "--port=abc", "--port=-1", "--port=65536", "--port=", "--port=99999999999999",
        "--threads=0", "--threads=257", "--threads=two",
        "--scheme=ftp", "--log-level=verbose", "--log-level=FATAL", "--mcp-path=mcp", "--mcp-path=", "--address=",
    };
    for (const auto& arg : bad) {
        Args args{arg};
        EXPECT_THROW(LoadServerConfig(args.argc(), args.argv()), std::invalid_argument) << arg;
    }

    ::setenv("STOREMCP_PORT", "http", 1);
    Args none{};
    EXPECT_THROW(LoadServerConfig(none.argc(), none.argv()), std::invalid_argument);
}

TEST_F(ServerConfigTest, PortBoundsAccepted) {
    Args low{"--port=0"};
    EXPECT_EQ(LoadServerConfig(low.argc(), low.argv()).port, "0");
    Args high{"--port=65535", "--threads=256"};
    ServerConfig cfg = LoadServerConfig(high.argc(), high.argv());
    EXPECT_EQ(cfg.port, "65535");
    EXPECT_EQ(cfg.threads, 256u);
}

TEST(GetArgValue, ExactKeyAndLastWins) {
    Args args{"--port=1", "--portx=2", "--port", "--port=3", "positional"};
    auto v = GetArgValue(args.argc(), args.argv(), "--port");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v.value(), "3");
    EXPECT_FALSE(GetArgValue(args.argc(), args.argv(), "--threads").has_value());
    EXPECT_FALSE(GetArgValue(args.argc(), args.argv(), "--por").has_value());
}

TEST(LoggerLevels, ParsesConfiguredNamesOnly) {
    LogLevel level = LogLevel::LOG_INFO_LEVEL;
    EXPECT_TRUE(Logger::tryParseLevel("warning", level));
    EXPECT_EQ(level, LogLevel::LOG_WARN_LEVEL);
    EXPECT_TRUE(Logger::tryParseLevel("Error", level));
    EXPECT_EQ(level, LogLevel::LOG_ERROR_LEVEL);
    EXPECT_FALSE(Logger::tryParseLevel("FATAL", level));
    EXPECT_FALSE(Logger::tryParseLevel("", level));
    EXPECT_EQ(level, LogLevel::LOG_ERROR_LEVEL);
}
