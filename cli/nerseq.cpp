/*
 * nerseq - Named entity tagging tool (nerseq)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nerseq/classifier.hpp"
#include "nerseq/error.hpp"
#include "nerseq/logger.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace nerseq;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "nerseq Named Entity Tagger v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] <text...>\n";
    std::cout << "       " << progName << " [options] < sentences.txt\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  text          Text to tag (can be multiple words)\n";
    std::cout << "                Without text, every stdin line is tagged separately\n\n";
    std::cout << "Options:\n";
    std::cout << "  --install <dir>      Stanford NER directory\n";
    std::cout << "  --jar <file>         NER jar inside the install directory\n";
    std::cout << "  --classifier <file>  Model under <install>/classifiers\n";
    std::cout << "  --java <path>        Java executable\n";
    std::cout << "  --heap <size>        Worker max heap (e.g. 1500m)\n";
    std::cout << "  --timeout <ms>       Fail requests not answered in time (0 = wait forever)\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Output:\n";
    std::cout << "  <input#>\\t<sentence#>\\t<CATEGORY>\\t<mention>, one entity per line\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  NERSEQ_INSTALL_PATH  Default for --install\n";
    std::cout << "  NERSEQ_JAR           Default for --jar\n";
    std::cout << "  NERSEQ_CLASSIFIER    Default for --classifier\n";
    std::cout << "  NERSEQ_JAVA          Default for --java\n";
    std::cout << "  NERSEQ_JAVA_HEAP     Default for --heap\n";
    std::cout << "  NERSEQ_TIMEOUT_MS    Default for --timeout\n";
    std::cout << "  NERSEQ_LOG_LEVEL     Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " Barack Obama visited Paris\n";
    std::cout << "  " << progName << " --install ./stanford-ner-2015-12-09 < news.txt\n";
}

// Newlines delimit requests on the wire
std::string flattenLine(std::string text) {
    std::replace(text.begin(), text.end(), '\n', ' ');
    std::replace(text.begin(), text.end(), '\r', ' ');
    return text;
}

void printResult(std::size_t input, const ClassificationResult& result) {
    for (std::size_t sentence = 0; sentence < result.size(); ++sentence) {
        for (const auto& entry : result[sentence]) {
            for (const auto& mention : entry.second) {
                std::cout << input << "\t" << (sentence + 1) << "\t"
                          << entry.first << "\t" << mention << "\n";
            }
        }
    }
    std::cout << std::flush;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; NERSEQ_LOG_LEVEL overrides
    if (!std::getenv("NERSEQ_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    ClassifierOptions options = ClassifierOptions::fromEnv();
    std::vector<std::string> words;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }

        bool takesValue = arg == "--install" || arg == "--jar" || arg == "--classifier" ||
                          arg == "--java" || arg == "--heap" || arg == "--timeout";
        if (takesValue) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--install") {
                options.installPath = value;
            } else if (arg == "--jar") {
                options.jar = value;
            } else if (arg == "--classifier") {
                options.classifier = value;
            } else if (arg == "--java") {
                options.java = value;
            } else if (arg == "--heap") {
                options.javaHeap = value;
            } else {
                try {
                    options.timeout = std::chrono::milliseconds(std::stoll(value));
                } catch (const std::exception&) {
                    std::cerr << "Error: Invalid timeout: " << value << "\n";
                    return 1;
                }
            }
            continue;
        }
        words.push_back(arg);
    }

    std::vector<std::string> inputs;
    if (!words.empty()) {
        std::ostringstream text;
        for (std::size_t i = 0; i < words.size(); ++i) {
            if (i > 0) text << " ";
            text << words[i];
        }
        inputs.push_back(flattenLine(text.str()));
    } else if (!isatty(fileno(stdin))) {
        std::string line;
        while (std::getline(std::cin, line)) {
            inputs.push_back(flattenLine(line));
        }
    } else {
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    // A dead worker must surface as a failed write, not kill the CLI
    std::signal(SIGPIPE, SIG_IGN);

    try {
        Classifier classifier(options);

        // Everything is submitted up front; the classifier answers in order
        std::vector<std::future<ClassificationResult>> pending;
        pending.reserve(inputs.size());
        for (const auto& input : inputs) {
            pending.push_back(classifier.getEntities(input));
        }
        LOG_DEBUG("Submitted " + std::to_string(pending.size()) + " request(s)");

        int exitCode = 0;
        for (std::size_t i = 0; i < pending.size(); ++i) {
            while (pending[i].wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
                if (g_shutdown_requested) {
                    std::cerr << "\nShutdown requested, stopping worker..." << std::endl;
                    classifier.exit();
                    return 130;
                }
            }

            try {
                printResult(i + 1, pending[i].get());
            } catch (const SequencerError& e) {
                std::cerr << "Error: input " << (i + 1) << ": " << e.what()
                          << " (" << errorKindToString(e.kind()) << ")" << std::endl;
                exitCode = 1;
            }
        }

        classifier.exit();
        return exitCode;

    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
