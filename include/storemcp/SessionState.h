//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionState.h
// Purpose: Handshake completion flag shared by all requests handled by one server instance
//==========================================================================================================

#pragma once

#include <atomic>

namespace storemcp {

//==========================================================================================================
// SessionState
// Purpose: Records whether a successful initialize has been handled.
// Notes:
//   - Starts not ready, becomes ready once and is never reset.
//   - Safe for concurrent readers and writers.
//==========================================================================================================
class SessionState {
public:
    SessionState() = default;
    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;

    bool IsReady() const;

    // Idempotent. Only the initialize handler calls this.
    void MarkReady();

private:
    std::atomic<bool> ready{false};
};

} // namespace storemcp
