/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nerseq/tokenizer.hpp"
#include <sstream>

namespace nerseq {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

std::string trimCopy(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n\f\v");
    return value.substr(start, end - start + 1);
}

}

Tokenizer::Tokenizer()
    : punctuation_(R"(([^\w.'/+<>,&-]))"),
      commaSpace_(R"((,\s))"),
      quoteSpace_(R"(('\s))"),
      finalPeriod_(R"(\. *(\n|$))") {
    // Split contractions and fused colloquial forms before punctuation handling
    contractions_.emplace_back(std::regex(R"((.)('ll|'re|'ve|n't|'s|'m|'d)\b)", kIcase), "$1 $2");
    contractions_.emplace_back(std::regex(R"(\b(can)(not)\b)", kIcase), "$1 $2");
    contractions_.emplace_back(std::regex(R"(\b(D)('ye)\b)", kIcase), "$1 $2");
    contractions_.emplace_back(std::regex(R"(\b(Gim)(me)\b)", kIcase), "$1 $2");
    contractions_.emplace_back(std::regex(R"(\b(Gon)(na)\b)", kIcase), "$1 $2");
    contractions_.emplace_back(std::regex(R"(\b(Got)(ta)\b)", kIcase), "$1 $2");
    contractions_.emplace_back(std::regex(R"(\b(Lem)(me)\b)", kIcase), "$1 $2");
    contractions_.emplace_back(std::regex(R"(\b(Mor)('n)\b)", kIcase), "$1 $2");
    contractions_.emplace_back(std::regex(R"(\b(T)(is)\b)", kIcase), "$1 $2");
    contractions_.emplace_back(std::regex(R"(\b(T)(was)\b)", kIcase), "$1 $2");
    contractions_.emplace_back(std::regex(R"(\b(Wan)(na)\b)", kIcase), "$1 $2");
    contractions_.emplace_back(std::regex(R"(\b(Whad)(dd)(ya)\b)", kIcase), "$1 $2 $3");
    contractions_.emplace_back(std::regex(R"(\b(Wha)(t)(cha)\b)", kIcase), "$1 $2 $3");
}

std::vector<std::string> Tokenizer::tokenize(const std::string& text) const {
    std::string work = text;
    for (const auto& rule : contractions_) {
        work = std::regex_replace(work, rule.first, rule.second);
    }

    // Non-ASCII bytes fall into the punctuation class and end up isolated
    work = std::regex_replace(work, punctuation_, " $1 ");
    work = std::regex_replace(work, commaSpace_, " $1");
    work = std::regex_replace(work, quoteSpace_, " $1");
    work = std::regex_replace(work, finalPeriod_, " . ");

    std::vector<std::string> tokens;
    std::istringstream stream(work);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::size_t Tokenizer::countTokens(const std::string& text) const {
    std::size_t count = 0;
    for (const auto& token : tokenize(text)) {
        if (utf8Length(token) > 1) {
            ++count;
        }
    }
    return count;
}

std::size_t Tokenizer::countTaggedTokens(const std::string& line) {
    std::size_t count = 0;
    size_t pos = 0;
    while (pos <= line.size()) {
        size_t next = line.find(' ', pos);
        if (next == std::string::npos) {
            next = line.size();
        }
        std::string token = line.substr(pos, next - pos);
        std::string surface = unescape(token.substr(0, token.find('/')));
        if (utf8Length(trimCopy(surface)) > 1) {
            ++count;
        }
        pos = next + 1;
    }
    return count;
}

std::string Tokenizer::unescape(const std::string& surface) {
    if (surface == "``" || surface == "''") return "'";
    if (surface == "-LRB-") return "(";
    if (surface == "-RRB-") return ")";
    if (surface == "-LSB-") return "[";
    if (surface == "-RSB-") return "]";
    if (surface == "-LCB-") return "{";
    if (surface == "-RCB-") return "}";
    return surface;
}

std::size_t Tokenizer::utf8Length(const std::string& s) noexcept {
    std::size_t length = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++length;
        }
    }
    return length;
}

}
