/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nerseq/channel.hpp"
#include "nerseq/logger.hpp"
#include <chrono>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace nerseq {

namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr auto kTermGrace = std::chrono::seconds(2);

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool writeAll(int fd, const std::string& data) {
    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return true;
}

}

ProcessChannel::ProcessChannel(std::vector<std::string> argv)
    : argv_(std::move(argv)) {
}

ProcessChannel::~ProcessChannel() {
    close();
}

void ProcessChannel::setHandlers(OutputHandler onOutput, CloseHandler onClose) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    onOutput_ = std::move(onOutput);
    onClose_ = std::move(onClose);
}

bool ProcessChannel::start() {
    if (running_.load() || pid_ > 0) {
        LOG_WARN("Worker already started");
        return false;
    }
    if (argv_.empty()) {
        LOG_ERROR("Cannot start worker: empty command line");
        return false;
    }

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe, execPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };

    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(execPipe, O_CLOEXEC) != 0) {
        LOG_ERROR("Failed to create worker pipes: " + std::string(std::strerror(errno)));
        closeAll();
        return false;
    }

    std::vector<char*> args;
    args.reserve(argv_.size() + 1);
    for (auto& arg : argv_) {
        args.push_back(arg.data());
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        LOG_ERROR("Failed to fork worker: " + std::string(std::strerror(errno)));
        closeAll();
        return false;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    // exec succeeded iff the close-on-exec pipe closes without data
    int execErr = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        LOG_ERROR("Failed to execute worker '" + argv_[0] + "': " + std::strerror(execErr));
        int status = 0;
        ::waitpid(pid, &status, 0);
        closeAll();
        return false;
    }

    pid_ = pid;
    stdinFd_ = inPipe[1];
    stdoutFd_ = outPipe[0];
    stderrFd_ = errPipe[0];
    running_.store(true);

    try {
        readerThread_ = std::thread(&ProcessChannel::readLoop, this);
        stderrThread_ = std::thread(&ProcessChannel::stderrLoop, this);
        writerThread_ = std::thread(&ProcessChannel::writeLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start worker I/O threads: " + std::string(e.what()));
        close();
        return false;
    }

    LOG_INFO("Worker started (pid " + std::to_string(pid_) + "): " + argv_[0]);
    return true;
}

bool ProcessChannel::write(const std::string& data) {
    if (!running_.load()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        writeQueue_.push_back(data);
    }
    writeAvailable_.notify_one();
    return true;
}

void ProcessChannel::close() noexcept {
    if (pid_ <= 0 || stopping_.exchange(true)) {
        return;
    }

    LOG_DEBUG("Stopping worker (pid " + std::to_string(pid_) + ")");
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        running_.store(false);
    }
    writeAvailable_.notify_all();
    if (writerThread_.joinable()) {
        writerThread_.join();
    }

    ::kill(pid_, SIGTERM);

    int status = 0;
    auto deadline = std::chrono::steady_clock::now() + kTermGrace;
    while (::waitpid(pid_, &status, WNOHANG) == 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("Worker ignored SIGTERM, killing (pid " + std::to_string(pid_) + ")");
            ::kill(pid_, SIGKILL);
            ::waitpid(pid_, &status, 0);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    const auto self = std::this_thread::get_id();
    for (std::thread* t : {&readerThread_, &stderrThread_}) {
        if (!t->joinable()) continue;
        if (t->get_id() == self) {
            t->detach();
        } else {
            t->join();
        }
    }

    closeFds();
    LOG_INFO("Worker stopped");
}

void ProcessChannel::closeFds() noexcept {
    closeFd(stdinFd_);
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

void ProcessChannel::readLoop() {
    setThreadName("Worker-out");
    char buf[kReadChunk];

    while (true) {
        ssize_t n = ::read(stdoutFd_, buf, sizeof(buf));
        if (n > 0) {
            std::lock_guard<std::mutex> lock(handlerMutex_);
            if (onOutput_) {
                try {
                    onOutput_(std::string(buf, static_cast<std::size_t>(n)));
                } catch (const std::exception& e) {
                    LOG_ERROR("Worker output handler error: " + std::string(e.what()));
                }
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            LOG_ERROR("Worker stdout read failed: " + std::string(std::strerror(errno)));
        }
        break;
    }

    LOG_DEBUG("Worker stdout closed");
    running_.store(false);
    writeAvailable_.notify_all();

    std::lock_guard<std::mutex> lock(handlerMutex_);
    if (onClose_) {
        try {
            onClose_();
        } catch (const std::exception& e) {
            LOG_ERROR("Worker close handler error: " + std::string(e.what()));
        }
    }
}

void ProcessChannel::stderrLoop() {
    setThreadName("Worker-err");
    char buf[kReadChunk];
    std::string pending;

    while (true) {
        ssize_t n = ::read(stderrFd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;

        pending.append(buf, static_cast<std::size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            LOG_DEBUG("worker: " + pending.substr(0, pos));
            pending.erase(0, pos + 1);
        }
    }
    if (!pending.empty()) {
        LOG_DEBUG("worker: " + pending);
    }
}

void ProcessChannel::writeLoop() {
    setThreadName("Worker-in");

    while (true) {
        std::string data;
        {
            std::unique_lock<std::mutex> lock(writeMutex_);
            writeAvailable_.wait(lock, [this] {
                return !writeQueue_.empty() || !running_.load();
            });
            if (!running_.load()) {
                break;
            }
            data = std::move(writeQueue_.front());
            writeQueue_.pop_front();
        }

        if (!writeAll(stdinFd_, data)) {
            LOG_ERROR("Worker stdin write failed: " + std::string(std::strerror(errno)));
            running_.store(false);
            break;
        }
        LOG_TRACE("Wrote " + std::to_string(data.size()) + " bytes to worker");
    }

    // EOF on the worker's stdin
    closeFd(stdinFd_);
}

}
