/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace nerseq {

using OutputHandler = std::function<void(const std::string& chunk)>;
using CloseHandler = std::function<void()>;

// Bidirectional line stream to a long-lived worker. Output arrives in
// arbitrary chunks, in FIFO order relative to what was written.
class Channel {
public:
    virtual ~Channel() = default;

    // Replacing the handlers waits for a handler call in progress to return,
    // so empty handlers detach a consumer that is about to be destroyed.
    virtual void setHandlers(OutputHandler onOutput, CloseHandler onClose) = 0;

    // Queues data for the worker. Never blocks on the worker; returns false
    // once the channel is closed.
    [[nodiscard]] virtual bool write(const std::string& data) = 0;

    virtual void close() noexcept = 0;
    [[nodiscard]] virtual bool isOpen() const noexcept = 0;
};

// Worker subprocess spoken to over stdin/stdout pipes. Its stderr is
// forwarded to the log at DEBUG level.
class ProcessChannel final : public Channel {
public:
    explicit ProcessChannel(std::vector<std::string> argv);
    ~ProcessChannel() override;

    ProcessChannel(const ProcessChannel&) = delete;
    ProcessChannel& operator=(const ProcessChannel&) = delete;
    ProcessChannel(ProcessChannel&&) = delete;
    ProcessChannel& operator=(ProcessChannel&&) = delete;

    void setHandlers(OutputHandler onOutput, CloseHandler onClose) override;

    // Spawns the worker. Returns false if the executable could not be run.
    // The embedding process should ignore SIGPIPE; otherwise a worker that
    // dies with writes pending terminates it instead of closing the channel.
    [[nodiscard]] bool start();

    [[nodiscard]] bool write(const std::string& data) override;
    void close() noexcept override;
    [[nodiscard]] bool isOpen() const noexcept override { return running_.load(); }

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] const std::vector<std::string>& argv() const noexcept { return argv_; }

private:
    void readLoop();
    void stderrLoop();
    void writeLoop();
    void closeFds() noexcept;

    std::vector<std::string> argv_;
    pid_t pid_ = -1;
    int stdinFd_ = -1;
    int stdoutFd_ = -1;
    int stderrFd_ = -1;

    // Held by the reader thread while it runs a handler
    std::mutex handlerMutex_;
    OutputHandler onOutput_;
    CloseHandler onClose_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::mutex writeMutex_;
    std::condition_variable writeAvailable_;
    std::deque<std::string> writeQueue_;

    std::thread readerThread_;
    std::thread stderrThread_;
    std::thread writerThread_;
};

}
