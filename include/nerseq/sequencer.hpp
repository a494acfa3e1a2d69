/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "nerseq/error.hpp"
#include "nerseq/tokenizer.hpp"
#include "nerseq/types.hpp"

namespace nerseq {

class Channel;

struct SequencerOptions {
    // Upper bound on submit-to-result time; zero waits forever.
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds watchdogInterval{50};
};

struct Ticket {
    RequestId id = 0;
    std::future<ClassificationResult> result;
};

// Serializes classification requests against a single worker channel.
//
// Exactly one request is written to the worker at a time; the rest wait in
// arrival order. Worker output is split into lines and attributed to the
// in-flight request until the tokens it echoed cover the tokens that were
// sent, at which point the request resolves and the next one is written.
//
// A request abandoned while in flight (timeout or cancel) leaves the session
// draining: its remaining output is discarded before anything else is sent.
class Sequencer final {
public:
    explicit Sequencer(Channel& channel, SequencerOptions options = {});
    ~Sequencer();

    Sequencer(const Sequencer&) = delete;
    Sequencer& operator=(const Sequencer&) = delete;
    Sequencer(Sequencer&&) = delete;
    Sequencer& operator=(Sequencer&&) = delete;

    // `text` must not contain newlines; they delimit requests on the wire.
    [[nodiscard]] Ticket submit(const std::string& text);

    // Fails the request with ErrorKind::Cancelled. False if it already finished.
    bool cancel(RequestId id);

    // Fails everything outstanding with ErrorKind::Shutdown.
    void shutdown() noexcept;

    [[nodiscard]] bool isBusy() const noexcept;
    [[nodiscard]] bool isDraining() const noexcept;
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] std::optional<RequestId> inFlight() const noexcept;

private:
    struct Request {
        RequestId id = 0;
        std::string text;
        long long budget = 0;
        std::promise<ClassificationResult> promise;
        std::chrono::steady_clock::time_point deadline;
        bool hasDeadline = false;
    };

    struct Active {
        Request request;
        ClassificationResult result;
    };

    void onOutput(const std::string& chunk);
    void onClose();

    void handleLineLocked(const std::string& line);
    void dispatchLocked(Request request);
    void dispatchNextLocked();
    void abandonLocked(ErrorKind kind, const std::string& reason);
    void failAllLocked(ErrorKind kind, const std::string& reason);
    void expireLocked(std::chrono::steady_clock::time_point now);
    void watchdogLoop();

    Channel& channel_;
    SequencerOptions options_;
    Tokenizer tokenizer_;

    mutable std::mutex mutex_;
    std::condition_variable watchdogWake_;

    bool busy_ = false;
    bool closed_ = false;
    bool shutdown_ = false;
    RequestId nextId_ = 1;
    std::deque<Request> queue_;
    std::optional<Active> active_;

    // Token budget still owed by an abandoned request; output is discarded
    // until it reaches zero.
    bool draining_ = false;
    long long drainBudget_ = 0;

    // Output bytes after the last newline
    std::string partialLine_;

    std::thread watchdogThread_;
};

}
