//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRouter.cpp
// Purpose: Method table definition and lookup
//==========================================================================================================

#include "storemcp/MethodRouter.h"
#include "storemcp/Handlers.h"

namespace storemcp {

namespace {

constexpr Route kRoutes[] = {
    // method                  gated  respond  handler
    {Methods::Initialize,      false, true,    &HandleInitialize},
    {Methods::Initialized,     false, false,   &HandleInitializedNotification},
    {Methods::ListTools,       true,  true,    &HandleToolsList},
    {Methods::CallTool,        true,  true,    &HandleToolsCall},
    {Methods::Ping,            false, true,    &HandlePing},
};

} // namespace

const Route* FindRoute(std::string_view method) {
    for (const auto& route : kRoutes) {
        if (route.method == method) {
            return &route;
        }
    }
    return nullptr;
}

std::span<const Route> Routes() {
    return std::span<const Route>(kRoutes);
}

} // namespace storemcp
