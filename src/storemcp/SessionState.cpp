//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionState.cpp
// Purpose: Atomic handshake state
//==========================================================================================================

#include "storemcp/SessionState.h"

namespace storemcp {

bool SessionState::IsReady() const {
    return ready.load(std::memory_order_acquire);
}

void SessionState::MarkReady() {
    ready.store(true, std::memory_order_release);
}

} // namespace storemcp
