//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Configuration loading and validation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "env/EnvVars.h"
#include "storemcp/Config.h"

namespace storemcp {

namespace {

constexpr unsigned long kMaxThreads = 256;

bool allDigits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
}

// Bounded unsigned parse; rejects signs, blanks and values above maxValue.
unsigned long parseBounded(const std::string& setting, const std::string& value,
                           unsigned long minValue, unsigned long maxValue) {
    if (!allDigits(value) || value.size() > 10) {
        throw std::invalid_argument(setting + " must be a number, got '" + value + "'");
    }
    unsigned long n = std::stoul(value);
    if (n < minValue || n > maxValue) {
        throw std::invalid_argument(setting + " must be between " + std::to_string(minValue) + " and " +
                                    std::to_string(maxValue) + ", got " + value);
    }
    return n;
}

// Environment value, overridden by --flag=value when given.
std::string setting(int argc, char** argv, const char* envName, const char* flag, const std::string& def) {
    std::string v = GetEnvOrDefault(envName, def);
    if (auto arg = GetArgValue(argc, argv, flag); arg.has_value()) {
        v = arg.value();
    }
    return v;
}

} // namespace

std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key) {
    std::optional<std::string> found;
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.compare(0, eq, key) == 0 && eq == key.size()) {
            found = a.substr(eq + 1);
        }
    }
    return found;
}

ServerConfig LoadServerConfig(int argc, char** argv) {
    ServerConfig cfg;

    cfg.address = setting(argc, argv, "STOREMCP_ADDRESS", "--address", cfg.address);
    if (cfg.address.empty()) {
        throw std::invalid_argument("address must not be empty");
    }

    cfg.port = setting(argc, argv, "STOREMCP_PORT", "--port", cfg.port);
    (void)parseBounded("port", cfg.port, 0, 65535);

    cfg.scheme = setting(argc, argv, "STOREMCP_SCHEME", "--scheme", cfg.scheme);
    std::transform(cfg.scheme.begin(), cfg.scheme.end(), cfg.scheme.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (cfg.scheme != "http" && cfg.scheme != "https") {
        throw std::invalid_argument("scheme must be http or https, got '" + cfg.scheme + "'");
    }

    cfg.certFile = setting(argc, argv, "STOREMCP_CERT_FILE", "--cert", "");
    cfg.keyFile = setting(argc, argv, "STOREMCP_KEY_FILE", "--key", "");
    if (cfg.scheme == "https" && (cfg.certFile.empty() || cfg.keyFile.empty())) {
        throw std::invalid_argument("https requires both a certificate and a key file");
    }

    cfg.threads = static_cast<unsigned int>(
        parseBounded("threads", setting(argc, argv, "STOREMCP_THREADS", "--threads", "4"), 1, kMaxThreads));

    cfg.mcpPath = setting(argc, argv, "STOREMCP_MCP_PATH", "--mcp-path", cfg.mcpPath);
    if (cfg.mcpPath.empty() || cfg.mcpPath.front() != '/') {
        throw std::invalid_argument("mcp path must start with '/', got '" + cfg.mcpPath + "'");
    }

    const std::string level = setting(argc, argv, "STOREMCP_LOG_LEVEL", "--log-level", "INFO");
    if (!Logger::tryParseLevel(level, cfg.logLevel)) {
        throw std::invalid_argument("log level must be DEBUG, INFO, WARN or ERROR, got '" + level + "'");
    }

    cfg.logFile = setting(argc, argv, "STOREMCP_LOG_FILE", "--log-file", "");
    return cfg;
}

} // namespace storemcp
