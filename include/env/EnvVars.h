//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables and whitespace-separated lists safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set or is set to the empty string.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// SplitWhitespace
// Purpose: Splits a string on runs of whitespace, dropping empty tokens.
//==========================================================================================================
inline std::vector<std::string> SplitWhitespace(const std::string& value) {
    std::vector<std::string> out;
    std::istringstream iss(value);
    std::string token;
    while (iss >> token) {
        out.push_back(token);
    }
    return out;
}
