/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "nerseq/sequencer.hpp"
#include "nerseq/types.hpp"

namespace nerseq {

class Channel;

struct ClassifierOptions {
    std::filesystem::path installPath = "stanford-ner-2015-12-09";
    std::string jar = "stanford-ner.jar";
    std::string classifier = "english.all.3class.distsim.crf.ser.gz";
    std::string java = "java";
    std::string javaHeap = "1500m";
    std::chrono::milliseconds timeout{0};

    // Defaults overridden by NERSEQ_INSTALL_PATH, NERSEQ_JAR, NERSEQ_CLASSIFIER,
    // NERSEQ_JAVA, NERSEQ_JAVA_HEAP and NERSEQ_TIMEOUT_MS.
    [[nodiscard]] static ClassifierOptions fromEnv();

    [[nodiscard]] std::filesystem::path classifierPath() const;
    [[nodiscard]] std::filesystem::path jarPath() const;
    [[nodiscard]] std::string classPath() const;

    // Worker command line for CRFClassifier reading sentences from stdin.
    [[nodiscard]] std::vector<std::string> command() const;
};

// Named entity classifier backed by one long-lived worker process.
class Classifier final {
public:
    // Validates the installation and starts the worker. Throws
    // ConfigurationError if files are missing or the worker cannot start.
    explicit Classifier(ClassifierOptions options = ClassifierOptions::fromEnv());

    // Uses an already running channel; installation files are still checked.
    Classifier(ClassifierOptions options, std::unique_ptr<Channel> channel);

    ~Classifier();

    Classifier(const Classifier&) = delete;
    Classifier& operator=(const Classifier&) = delete;
    Classifier(Classifier&&) = delete;
    Classifier& operator=(Classifier&&) = delete;

    // One EntityMap per sentence. Concurrent calls are answered in call order.
    // `text` should not contain newline characters.
    [[nodiscard]] std::future<ClassificationResult> getEntities(const std::string& text);

    [[nodiscard]] Ticket submit(const std::string& text);
    bool cancel(RequestId id);

    // Stops the worker. Outstanding requests fail with ErrorKind::Shutdown.
    void exit() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] const ClassifierOptions& options() const noexcept { return options_; }

    // Throws ConfigurationError naming the first missing file.
    static void checkPaths(const ClassifierOptions& options);

private:
    ClassifierOptions options_;
    std::unique_ptr<Channel> channel_;
    std::unique_ptr<Sequencer> sequencer_;
    std::atomic<bool> exited_{false};
};

}
