/*
 * nerseq - Named Entity Request Sequencer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "nerseq/types.hpp"

namespace nerseq {

// Tag the worker assigns to tokens outside any entity.
inline constexpr const char* kOutsideTag = "O";

struct TaggedToken {
    std::string surface;
    std::string tag;
};

// Splits `surface/TAG`; the surface is greedy so it may itself contain '/'.
[[nodiscard]] std::optional<TaggedToken> splitTaggedToken(const std::string& raw);

// Groups contiguous same-tag tokens of one output line into mentions.
//
// Adjacent entities sharing a tag with no "O" token between them are merged
// into a single mention, e.g. "New/ORGANIZATION York/ORGANIZATION Fed/ORGANIZATION"
// yields {ORGANIZATION: ["New York Fed"]}.
[[nodiscard]] EntityMap parseTaggedLine(const std::string& line);

}
