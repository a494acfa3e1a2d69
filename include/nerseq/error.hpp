/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace nerseq {

enum class ErrorKind : uint8_t {
    Timeout = 0,
    Cancelled,
    Shutdown,
    ChannelClosed
};

const char* errorKindToString(ErrorKind kind) noexcept;

// Installation files missing or the worker could not be started.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// Delivered through a request's future when it ends without a result.
class SequencerError : public std::runtime_error {
public:
    SequencerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}
