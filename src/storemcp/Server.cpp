//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Dispatcher implementation
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "storemcp/EnvelopeCodec.h"
#include "storemcp/MethodRouter.h"
#include "storemcp/Server.h"
#include "storemcp/SessionState.h"
#include "storemcp/errors/Errors.h"

namespace storemcp {

class Server::Impl {
public:
    explicit Impl(Implementation info) : serverInfo(std::move(info)) {}

    Implementation serverInfo;
    SessionState session;

    std::unique_ptr<JSONRPCResponse> dispatch(const JSONRPCRequest& req);
};

std::unique_ptr<JSONRPCResponse> Server::Impl::dispatch(const JSONRPCRequest& req) {
    const Route* route = FindRoute(req.method);
    if (!route) {
        LOG_DEBUG("Method not found: '{}'", req.method);
        return errors::makeErrorResponse(req.id, errors::methodNotFound(req.method));
    }
    if (route->gated && !session.IsReady()) {
        LOG_DEBUG("Rejected {} before initialize", req.method);
        return errors::makeErrorResponse(req.id, errors::notInitialized());
    }

    HandlerContext ctx{session, serverInfo};
    HandlerResult outcome;
    try {
        outcome = route->handler(ctx, req.params);
    } catch (const std::exception& e) {
        LOG_ERROR("Handler for {} threw: {}", req.method, e.what());
        outcome = errors::internalError(e.what());
    }

    if (!route->respond) {
        return nullptr;
    }
    if (auto* err = std::get_if<errors::McpError>(&outcome)) {
        return errors::makeErrorResponse(req.id, *err);
    }
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = req.id;
    response->result = std::move(std::get<JSONValue>(outcome));
    return response;
}

Server::Server(Implementation serverInfo)
    : pImpl(std::make_unique<Impl>(std::move(serverInfo))) {
    FUNC_SCOPE();
}

Server::~Server() = default;

std::optional<std::string> Server::Handle(const std::string& raw) {
    FUNC_SCOPE();
    try {
        auto decoded = DecodeRequest(raw);
        if (auto* failure = std::get_if<DecodeFailure>(&decoded)) {
            LOG_WARN("Rejected request envelope: {} ({})", failure->error.message,
                     SerializeJSON(failure->error.data.value_or(JSONValue{})));
            return EncodeResponse(*MakeDecodeFailureResponse(*failure));
        }
        auto response = HandleJSONRPC(std::get<JSONRPCRequest>(decoded));
        if (!response) {
            return std::nullopt;
        }
        return EncodeResponse(*response);
    } catch (const std::exception& e) {
        LOG_ERROR("Request handling failed: {}", e.what());
        return EncodeResponse(*errors::makeErrorResponse(nullptr, errors::internalError(e.what())));
    }
}

std::unique_ptr<JSONRPCResponse> Server::HandleJSONRPC(const JSONRPCRequest& request) {
    FUNC_SCOPE();
    LOG_DEBUG("Dispatching method '{}'", request.method);
    return pImpl->dispatch(request);
}

bool Server::IsInitialized() const {
    return pImpl->session.IsReady();
}

const Implementation& Server::GetServerInfo() const {
    return pImpl->serverInfo;
}

} // namespace storemcp
