//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Server-side transport acceptor interface feeding raw request bytes to the dispatcher
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <optional>
#include <string>

namespace storemcp {

//==========================================================================================================
// ITransportAcceptor
// Purpose: Server-side acceptor interface which owns the listen lifecycle and hands every incoming
//          JSON-RPC payload to the registered request handler.
// Notes:
//   - Implementations bind/listen in Start(), stop/teardown in Stop().
//   - The request handler may be invoked concurrently from several I/O threads.
//==========================================================================================================
class ITransportAcceptor {
public:
    virtual ~ITransportAcceptor() = default;

    //==========================================================================================================
    // Starts the acceptor (binds/listens/spawns accept loop as needed).
    // Returns:
    //   Future that completes when the accept loop is running, or holds the bind failure.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the acceptor and releases resources.
    // Returns:
    //   Future that completes when the acceptor has stopped.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    //==========================================================================================================
    // Registers the request handler.
    // Args:
    //   handler: Takes the raw request body; returns the raw response body, or std::nullopt when the
    //            request produces no response.
    //==========================================================================================================
    using RequestHandler = std::function<std::optional<std::string>(const std::string& body)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    //==========================================================================================================
    // Registers an error handler to receive transport errors.
    // Args:
    //   handler: Callback with error string.
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace storemcp
