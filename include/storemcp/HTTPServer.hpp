//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS server for store-mcp-server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <string>
#include <future>
#include <memory>
#include "storemcp/Transport.h"

namespace storemcp {

  // Note: HTTPServer implements the server-side acceptor role (ITransportAcceptor)
  class HTTPServer : public ITransportAcceptor {
  public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, JSON-RPC path, I/O threads and TLS files.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8080)
    //   mcpPath: JSON-RPC endpoint path, POST only
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   threads: Number of threads running the I/O context
    //   greeting: Plain text body served at "/"
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8080"};
        std::string mcpPath{"/mcp"};
        std::string scheme{"http"}; // "http" or "https"
        std::string certFile; // PEM (required for https)
        std::string keyFile;  // PEM (required for https)
        unsigned int threads{4};
        std::string greeting{"hey there \xF0\x9F\x91\x8B this is store-mcp-server"};
    };

    explicit HTTPServer(const Options& opts);
    ~HTTPServer();

    //==========================================================================================================
    // Binds the listening socket, then starts the accept loop on the I/O threads.
    // Returns:
    //   Future that becomes ready once the server is listening; holds the exception when binding failed.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background threads.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop() override;

    //==========================================================================================================
    // Sets the handler for POST bodies on mcpPath.
    // Args:
    //   handler: Callback returning the response body, or std::nullopt for 202 Accepted.
    //==========================================================================================================
    void SetRequestHandler(ITransportAcceptor::RequestHandler handler) override;

    //==========================================================================================================
    // Sets the error handler for transport/server errors.
    // Args:
    //   handler: Callback invoked with error strings.
    //==========================================================================================================
    void SetErrorHandler(ITransportAcceptor::ErrorHandler handler) override;

    //==========================================================================================================
    // SetAuthorizationServerMetadata
    // Purpose: JSON document served at /.well-known/oauth-authorization-server. The route answers 404
    //          until a document is set.
    //==========================================================================================================
    void SetAuthorizationServerMetadata(std::string json);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

} // namespace storemcp
