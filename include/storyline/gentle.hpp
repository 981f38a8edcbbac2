#pragma once

#include <string>

#include "storyline/timed_text.hpp"

namespace storyline {

// ─── Gentle Alignment Reader ────────────────────────────────────────────────

// Reads a Gentle forced-alignment document: "transcript" plus "words"
// entries with word, case, startOffset, endOffset, start and end.
// Missing times default to 0. Malformed JSON throws std::runtime_error.
AlignmentInput parse_gentle_alignment(const std::string &json_text);
AlignmentInput read_gentle_alignment(const std::string &path);

} // namespace storyline
