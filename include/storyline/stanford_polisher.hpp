#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "storyline/config.hpp"
#include "storyline/named_entity.hpp"
#include "storyline/result.hpp"

namespace storyline {

// ─── Stanford NER Polisher ──────────────────────────────────────────────────
//
// Turns per-token Stanford NER output ("token<TAB>TYPE" lines) into entity
// candidates with transcript offsets. Transcriber notes in square brackets
// are folded into the neighbouring entity, so "Martin [Luther] King" comes
// out as one Person with the bracketed span as its contextual text.

// PERSON, LOCATION and ORGANIZATION; anything else is Unset.
EntityType stanford_entity_type(std::string_view label);

// The token as it appears in the transcript: PTB escapes undone, bare
// punctuation reduced to "[" / "]" or "" when it should be ignored.
std::string stanford_source_form(std::string_view token);

// Fails with TranscriptDesync when a token cannot be found ahead of the
// previous one, BracketMismatch when the input ends inside brackets.
Result<std::vector<NamedEntity>>
polish_stanford(const std::vector<std::string> &lines,
                const std::string &transcript,
                const PolisherConfig &config = PolisherConfig{});

} // namespace storyline
