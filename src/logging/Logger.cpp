//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger static state, level parsing and log file management.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <errno.h>
#include <iomanip>

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

bool Logger::tryParseLevel(const std::string& lvl, LogLevel& out) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) {
        s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "DEBUG") { out = LogLevel::LOG_DEBUG_LEVEL; return true; }
    if (s == "INFO")  { out = LogLevel::LOG_INFO_LEVEL;  return true; }
    if (s == "WARN" || s == "WARNING") { out = LogLevel::LOG_WARN_LEVEL; return true; }
    if (s == "ERROR") { out = LogLevel::LOG_ERROR_LEVEL; return true; }
    return false;
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    if (filePath.empty()) {
        return;
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    ::localtime_r(&now, &local);
    sLogFile << "\n=== store-mcp-server log opened at " << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
}
