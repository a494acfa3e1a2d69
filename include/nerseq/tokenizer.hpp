/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace nerseq {

// Penn Treebank style word tokenizer used to size the worker's expected output.
// A token is meaningful when it is longer than one character.
class Tokenizer {
public:
    Tokenizer();

    Tokenizer(const Tokenizer&) = delete;
    Tokenizer& operator=(const Tokenizer&) = delete;

    [[nodiscard]] std::vector<std::string> tokenize(const std::string& text) const;

    // Meaningful tokens in raw input text.
    [[nodiscard]] std::size_t countTokens(const std::string& text) const;

    // Meaningful tokens in one line of `surface/TAG` worker output, after
    // undoing the worker's bracket and quote escapes.
    [[nodiscard]] static std::size_t countTaggedTokens(const std::string& line);

    // -LRB- -> "(", `` -> "'", etc. Anything else is returned unchanged.
    [[nodiscard]] static std::string unescape(const std::string& surface);

    // Length in code points; invalid continuation bytes are not counted.
    [[nodiscard]] static std::size_t utf8Length(const std::string& s) noexcept;

private:
    std::vector<std::pair<std::regex, const char*>> contractions_;
    std::regex punctuation_;
    std::regex commaSpace_;
    std::regex quoteSpace_;
    std::regex finalPeriod_;
};

}
