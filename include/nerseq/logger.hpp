/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace nerseq {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Exposed for tests and the CLI; falls back to INFO on unknown names.
    [[nodiscard]] static LogLevel parseLevel(const std::string& name) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::nerseq::Logger::error(msg)
#define LOG_WARN(msg)  ::nerseq::Logger::warn(msg)  
#define LOG_INFO(msg)  ::nerseq::Logger::info(msg)
#define LOG_DEBUG(msg) ::nerseq::Logger::debug(msg)
#define LOG_TRACE(msg) ::nerseq::Logger::trace(msg)
