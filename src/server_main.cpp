//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: server_main.cpp
// Purpose: store-mcp-server executable: configuration, logging, HTTP acceptor and signal handling
//==========================================================================================================

#include <csignal>
#include <chrono>
#include <thread>
#include <atomic>
#include <iostream>
#include <stdexcept>

#include "logging/Logger.h"
#include "storemcp/Config.h"
#include "storemcp/HTTPServer.hpp"
#include "storemcp/Server.h"
#include "storemcp/auth/OAuthMetadata.hpp"

using namespace storemcp;

static std::atomic<bool> gRunning{true};

static void handleSig(int) {
    gRunning.store(false);
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ServerConfig cfg;
    try {
        cfg = LoadServerConfig(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "store-mcp-server: invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    Logger::setLogLevel(cfg.logLevel);
    if (!cfg.logFile.empty()) {
        Logger::setLogFile(cfg.logFile);
    }

    ::signal(SIGTERM, handleSig);
    ::signal(SIGINT, handleSig);

    Server server;

    HTTPServer::Options opts;
    opts.address = cfg.address;
    opts.port = cfg.port;
    opts.scheme = cfg.scheme;
    opts.certFile = cfg.certFile;
    opts.keyFile = cfg.keyFile;
    opts.threads = cfg.threads;
    opts.mcpPath = cfg.mcpPath;

    LOG_INFO("{} starting on {}:{}", server.GetServerInfo().name, cfg.address, cfg.port);

    std::unique_ptr<HTTPServer> http;
    try {
        http = std::make_unique<HTTPServer>(opts);
        http->SetRequestHandler([&server](const std::string& body) { return server.Handle(body); });
        http->SetErrorHandler([](const std::string& err) {
            LOG_ERROR("Server error: {}", err);
        });
        http->SetAuthorizationServerMetadata(SerializeJSON(auth::ToJSON(auth::LoadAuthorizationServerMetadataFromEnv())));
        http->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start listener on {}:{}: {}", cfg.address, cfg.port, e.what());
        return 1;
    }
    LOG_INFO("MCP endpoint: {}://{}:{}{}", cfg.scheme, cfg.address, cfg.port, cfg.mcpPath);

    while (gRunning.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    (void)http->Stop().wait();
    LOG_INFO("{} stopped", server.GetServerInfo().name);
    return 0;
}
