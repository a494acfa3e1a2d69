/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nerseq/parser.hpp"
#include "nerseq/logger.hpp"
#include <algorithm>
#include <regex>
#include <sstream>

namespace nerseq {

namespace {

std::string join(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& word : words) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

}

void EntityMap::add(const std::string& category, std::string mention) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&category](const Entry& e) { return e.first == category; });
    if (it == entries_.end()) {
        entries_.emplace_back(category, std::vector<std::string>{});
        it = entries_.end() - 1;
    }
    it->second.push_back(std::move(mention));
}

const std::vector<std::string>* EntityMap::find(const std::string& category) const noexcept {
    for (const auto& entry : entries_) {
        if (entry.first == category) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::vector<std::string> EntityMap::categories() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.first);
    }
    return names;
}

std::optional<TaggedToken> splitTaggedToken(const std::string& raw) {
    static const std::regex taggedRegex("(.+)/([A-Z]+)");
    std::smatch match;
    if (!std::regex_search(raw, match, taggedRegex)) {
        return std::nullopt;
    }
    return TaggedToken{match[1].str(), match[2].str()};
}

EntityMap parseTaggedLine(const std::string& line) {
    std::vector<TaggedToken> tokens;
    std::istringstream stream(line);
    std::string raw;
    while (stream >> raw) {
        if (auto token = splitTaggedToken(raw)) {
            tokens.push_back(std::move(*token));
        } else {
            LOG_TRACE("Dropping malformed token: " + raw);
        }
    }

    EntityMap entities;
    std::string prevTag;
    std::vector<std::string> buffer;

    auto flush = [&]() {
        if (!buffer.empty()) {
            entities.add(prevTag, join(buffer));
            buffer.clear();
        }
    };

    for (auto& token : tokens) {
        if (token.tag == kOutsideTag) {
            flush();
        } else if (token.tag != prevTag) {
            flush();
            buffer.push_back(std::move(token.surface));
        } else {
            buffer.push_back(std::move(token.surface));
        }
        prevTag = std::move(token.tag);
    }
    flush();

    return entities;
}

}
