//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger with level filtering, optional log file and LOG_* macros.
//==========================================================================================================
#pragma once

#include <mutex>
#include <iostream>
#include <sstream>
#include <fstream>
#include <string>
#include <cstring>
#include <format>
#include <cstdlib>
#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL
};

class Logger {
public:
    // Parses DEBUG/INFO/WARN(ING)/ERROR (case-insensitive). Returns false for anything else.
    static bool tryParseLevel(const std::string& lvl, LogLevel& out);

    // Variadic logging using C++20 std::vformat with runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::string("Format error: ") + e.what();
        }
        log(level, buffer, file, line);
    }

    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    // Opens filePath for appending and mirrors every record into it. An empty path closes the file.
    static void setLogFile(const std::string& filePath);

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        // ANSI colour for the label only, controlled by STOREMCP_LOG_COLOR
        static bool colorEnabled = [](){
            const std::string v = GetEnvOrDefault("STOREMCP_LOG_COLOR", "1");
            return (v == "1" || v == "true" || v == "TRUE");
        }();
        static bool useStderr = [](){
            const std::string v = GetEnvOrDefault("STOREMCP_LOG_STDERR", "0");
            return (v == "1" || v == "true" || v == "TRUE");
        }();

        std::ostringstream plain;
        plain << "[" << level << "] " << file << ":" << line << ": " << msg << '\n';

        if (colorEnabled) {
            const char* labelColor = (::strncmp(level, "ERROR", 5) == 0)
                ? "\033[38;5;88m" /* burgundy */ : "\033[35m" /* purple */;
            std::ostringstream colored;
            colored << "[" << labelColor << level << "\033[0m] " << file << ":" << line << ": " << msg << '\n';
            (useStderr ? std::cerr : std::cout) << colored.str() << std::flush;
        } else {
            (useStderr ? std::cerr : std::cout) << plain.str() << std::flush;
        }

        // The file never receives escape sequences
        if (sLogFile.is_open()) {
            sLogFile << plain.str();
            sLogFile.flush();
        }
    }

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Static members and the out-of-line helpers are defined in Logger.cpp

#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)

// Function entry/exit tracing, debug builds only
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
