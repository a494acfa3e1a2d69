/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nerseq/classifier.hpp"
#include "nerseq/channel.hpp"
#include "nerseq/error.hpp"
#include "nerseq/logger.hpp"
#include <cstdlib>

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

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val) {
        return defv;
    }
    std::string trimmed = trim(val);
    return trimmed.empty() ? defv : trimmed;
}

std::chrono::milliseconds env_ms(const char* name, std::chrono::milliseconds defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::chrono::milliseconds(std::stoll(val));
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + ": " + val);
        return defv;
    }
}

ClassifierOptions normalized(ClassifierOptions options) {
    options.installPath = trim(options.installPath.string());
    options.jar = trim(options.jar);
    options.classifier = trim(options.classifier);
    options.java = trim(options.java);
    options.javaHeap = trim(options.javaHeap);
    if (options.timeout.count() < 0) {
        options.timeout = std::chrono::milliseconds(0);
    }
    return options;
}

SequencerOptions sequencerOptions(const ClassifierOptions& options) {
    SequencerOptions seq;
    seq.timeout = options.timeout;
    return seq;
}

}

ClassifierOptions ClassifierOptions::fromEnv() {
    ClassifierOptions options;
    options.installPath = env_string("NERSEQ_INSTALL_PATH", options.installPath.string());
    options.jar = env_string("NERSEQ_JAR", options.jar);
    options.classifier = env_string("NERSEQ_CLASSIFIER", options.classifier);
    options.java = env_string("NERSEQ_JAVA", options.java);
    options.javaHeap = env_string("NERSEQ_JAVA_HEAP", options.javaHeap);
    options.timeout = env_ms("NERSEQ_TIMEOUT_MS", options.timeout);
    return options;
}

std::filesystem::path ClassifierOptions::classifierPath() const {
    return (installPath / "classifiers" / classifier).lexically_normal();
}

std::filesystem::path ClassifierOptions::jarPath() const {
    return (installPath / jar).lexically_normal();
}

std::string ClassifierOptions::classPath() const {
    return jarPath().string() + ":" + (installPath / "lib" / "*").lexically_normal().string();
}

std::vector<std::string> ClassifierOptions::command() const {
    return {
        java,
        "-mx" + javaHeap,
        "-cp",
        classPath(),
        "edu.stanford.nlp.ie.crf.CRFClassifier",
        "-loadClassifier",
        classifierPath().string(),
        "-readStdin"
    };
}

void Classifier::checkPaths(const ClassifierOptions& options) {
    auto classifierPath = options.classifierPath();
    if (!std::filesystem::is_regular_file(classifierPath)) {
        throw ConfigurationError("Classifier could not be found at path: " + classifierPath.string());
    }

    auto jarPath = options.jarPath();
    if (!std::filesystem::is_regular_file(jarPath)) {
        throw ConfigurationError("NER jar could not be found at path: " + jarPath.string());
    }
}

Classifier::Classifier(ClassifierOptions options)
    : options_(normalized(std::move(options))) {
    checkPaths(options_);

    auto process = std::make_unique<ProcessChannel>(options_.command());
    ProcessChannel* raw = process.get();
    channel_ = std::move(process);
    sequencer_ = std::make_unique<Sequencer>(*channel_, sequencerOptions(options_));

    LOG_DEBUG("Classifier: " + options_.classifierPath().string());
    LOG_DEBUG("Jar: " + options_.jarPath().string());

    if (!raw->start()) {
        throw ConfigurationError("Failed to start worker: " + options_.java);
    }
}

Classifier::Classifier(ClassifierOptions options, std::unique_ptr<Channel> channel)
    : options_(normalized(std::move(options))), channel_(std::move(channel)) {
    checkPaths(options_);
    if (!channel_) {
        throw ConfigurationError("No worker channel provided");
    }
    sequencer_ = std::make_unique<Sequencer>(*channel_, sequencerOptions(options_));
}

Classifier::~Classifier() {
    exit();
}

std::future<ClassificationResult> Classifier::getEntities(const std::string& text) {
    return submit(text).result;
}

Ticket Classifier::submit(const std::string& text) {
    return sequencer_->submit(text);
}

bool Classifier::cancel(RequestId id) {
    return sequencer_->cancel(id);
}

void Classifier::exit() noexcept {
    if (exited_.exchange(true)) {
        return;
    }
    // Fail outstanding requests first so they report Shutdown, not ChannelClosed
    if (sequencer_) {
        sequencer_->shutdown();
    }
    if (channel_) {
        channel_->close();
    }
}

bool Classifier::isRunning() const noexcept {
    return !exited_.load() && channel_ && channel_->isOpen();
}

}
