/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nerseq/sequencer.hpp"
#include "nerseq/channel.hpp"
#include "nerseq/logger.hpp"
#include "nerseq/parser.hpp"

namespace nerseq {

namespace {

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::exception_ptr makeError(ErrorKind kind, const std::string& message) {
    return std::make_exception_ptr(SequencerError(kind, message));
}

std::string requestLabel(RequestId id) {
    return "request #" + std::to_string(id);
}

}

const char* errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Shutdown: return "shutdown";
        case ErrorKind::ChannelClosed: return "channel closed";
        default: return "unknown";
    }
}

Sequencer::Sequencer(Channel& channel, SequencerOptions options)
    : channel_(channel), options_(options) {
    channel_.setHandlers(
        [this](const std::string& chunk) { onOutput(chunk); },
        [this]() { onClose(); });

    if (options_.timeout.count() > 0) {
        watchdogThread_ = std::thread(&Sequencer::watchdogLoop, this);
        LOG_DEBUG("Sequencer timeout: " + std::to_string(options_.timeout.count()) + "ms");
    }
}

Sequencer::~Sequencer() {
    shutdown();
    // Waits for a callback already running on the channel's reader thread
    channel_.setHandlers({}, {});
}

Ticket Sequencer::submit(const std::string& text) {
    // Tokenizing is the expensive part; keep it outside the lock
    std::string payload = trim(text);
    long long budget = static_cast<long long>(tokenizer_.countTokens(payload));

    std::lock_guard<std::mutex> lock(mutex_);

    Request request;
    request.id = nextId_++;
    request.text = std::move(payload);
    request.budget = budget;

    Ticket ticket;
    ticket.id = request.id;
    ticket.result = request.promise.get_future();

    if (shutdown_) {
        request.promise.set_exception(makeError(ErrorKind::Shutdown, "Sequencer is shut down"));
        return ticket;
    }
    if (closed_) {
        request.promise.set_exception(makeError(ErrorKind::ChannelClosed, "Worker channel is closed"));
        return ticket;
    }
    if (request.text.empty() && !busy_) {
        LOG_DEBUG(requestLabel(request.id) + " is empty, resolved without the worker");
        request.promise.set_value({});
        return ticket;
    }

    if (options_.timeout.count() > 0) {
        request.deadline = std::chrono::steady_clock::now() + options_.timeout;
        request.hasDeadline = true;
    }

    if (!busy_) {
        dispatchLocked(std::move(request));
    } else {
        LOG_DEBUG(requestLabel(request.id) + " queued behind " + std::to_string(queue_.size()) + " request(s)");
        queue_.push_back(std::move(request));
    }
    return ticket;
}

bool Sequencer::cancel(RequestId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (active_ && active_->request.id == id) {
        abandonLocked(ErrorKind::Cancelled, requestLabel(id) + " cancelled");
        return true;
    }

    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->id == id) {
            it->promise.set_exception(makeError(ErrorKind::Cancelled, requestLabel(id) + " cancelled"));
            queue_.erase(it);
            LOG_DEBUG(requestLabel(id) + " cancelled while queued");
            return true;
        }
    }
    return false;
}

void Sequencer::shutdown() noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!shutdown_) {
                shutdown_ = true;
                failAllLocked(ErrorKind::Shutdown, "Sequencer shut down");
            }
        }
        watchdogWake_.notify_all();
        if (watchdogThread_.joinable() && watchdogThread_.get_id() != std::this_thread::get_id()) {
            watchdogThread_.join();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Sequencer shutdown error: " + std::string(e.what()));
    }
}

bool Sequencer::isBusy() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

bool Sequencer::isDraining() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return draining_;
}

std::size_t Sequencer::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::optional<RequestId> Sequencer::inFlight() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) {
        return std::nullopt;
    }
    return active_->request.id;
}

void Sequencer::onOutput(const std::string& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);

    partialLine_ += chunk;
    size_t start = 0;
    size_t pos;
    while ((pos = partialLine_.find('\n', start)) != std::string::npos) {
        std::string line = partialLine_.substr(start, pos - start);
        start = pos + 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        handleLineLocked(line);
    }
    partialLine_.erase(0, start);
}

void Sequencer::onClose() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    if (!shutdown_) {
        LOG_WARN("Worker channel closed");
    }
    failAllLocked(ErrorKind::ChannelClosed, "Worker channel closed");
}

void Sequencer::handleLineLocked(const std::string& line) {
    if (line.find_first_not_of(" \t") == std::string::npos) {
        return;
    }

    long long tokens = static_cast<long long>(Tokenizer::countTaggedTokens(line));

    if (draining_) {
        drainBudget_ -= tokens;
        LOG_DEBUG("Discarded output of abandoned request (" + std::to_string(drainBudget_) + " tokens left)");
        if (drainBudget_ <= 0) {
            draining_ = false;
            drainBudget_ = 0;
            busy_ = false;
            dispatchNextLocked();
        }
        return;
    }

    if (!active_) {
        LOG_WARN("Discarding worker output with no request in flight: " + line);
        return;
    }

    active_->result.push_back(parseTaggedLine(line));
    active_->request.budget -= tokens;
    LOG_TRACE(requestLabel(active_->request.id) + " consumed " + std::to_string(tokens) +
              " tokens, " + std::to_string(active_->request.budget) + " left");

    if (active_->request.budget <= 0) {
        Active done = std::move(*active_);
        active_.reset();
        busy_ = false;

        LOG_DEBUG(requestLabel(done.request.id) + " completed with " +
                  std::to_string(done.result.size()) + " sentence(s)");
        done.request.promise.set_value(std::move(done.result));

        dispatchNextLocked();
    }
}

void Sequencer::dispatchLocked(Request request) {
    busy_ = true;
    const std::string payload = request.text + "\n";
    const RequestId id = request.id;

    LOG_DEBUG("Dispatching " + requestLabel(id) + " (budget " + std::to_string(request.budget) + ")");
    active_.emplace(Active{std::move(request), {}});

    if (!channel_.write(payload)) {
        LOG_ERROR("Failed to write " + requestLabel(id) + " to worker");
        closed_ = true;
        failAllLocked(ErrorKind::ChannelClosed, "Worker channel is closed");
    }
}

void Sequencer::dispatchNextLocked() {
    const auto now = std::chrono::steady_clock::now();
    while (!queue_.empty()) {
        Request next = std::move(queue_.front());
        queue_.pop_front();

        if (next.hasDeadline && next.deadline <= now) {
            next.promise.set_exception(makeError(ErrorKind::Timeout, requestLabel(next.id) + " timed out while queued"));
            continue;
        }
        // Empty text keeps its place in line but never reaches the worker
        if (next.text.empty()) {
            LOG_DEBUG(requestLabel(next.id) + " is empty, resolved without the worker");
            next.promise.set_value({});
            continue;
        }
        dispatchLocked(std::move(next));
        return;
    }
}

void Sequencer::abandonLocked(ErrorKind kind, const std::string& reason) {
    Active abandoned = std::move(*active_);
    active_.reset();

    abandoned.request.promise.set_exception(makeError(kind, reason));

    // The worker already has the text; its answer must not reach the next request
    draining_ = true;
    drainBudget_ = abandoned.request.budget;
    LOG_WARN(reason + ", draining " + std::to_string(drainBudget_) + " tokens of worker output");
}

void Sequencer::failAllLocked(ErrorKind kind, const std::string& reason) {
    std::size_t failed = 0;
    if (active_) {
        active_->request.promise.set_exception(makeError(kind, reason));
        active_.reset();
        ++failed;
    }
    for (auto& request : queue_) {
        request.promise.set_exception(makeError(kind, reason));
        ++failed;
    }
    queue_.clear();

    busy_ = false;
    draining_ = false;
    drainBudget_ = 0;
    partialLine_.clear();

    if (failed > 0) {
        LOG_WARN(reason + ": failed " + std::to_string(failed) + " outstanding request(s)");
    }
}

void Sequencer::expireLocked(std::chrono::steady_clock::time_point now) {
    if (active_ && active_->request.hasDeadline && active_->request.deadline <= now) {
        abandonLocked(ErrorKind::Timeout, requestLabel(active_->request.id) + " timed out after " +
                      std::to_string(options_.timeout.count()) + "ms");
    }

    for (auto it = queue_.begin(); it != queue_.end(); ) {
        if (it->hasDeadline && it->deadline <= now) {
            it->promise.set_exception(makeError(ErrorKind::Timeout, requestLabel(it->id) + " timed out while queued"));
            it = queue_.erase(it);
        } else {
            ++it;
        }
    }
}

void Sequencer::watchdogLoop() {
    setThreadName("Watchdog");

    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdown_) {
        watchdogWake_.wait_for(lock, options_.watchdogInterval, [this] { return shutdown_; });
        if (shutdown_) {
            break;
        }
        expireLocked(std::chrono::steady_clock::now());
    }
}

}
