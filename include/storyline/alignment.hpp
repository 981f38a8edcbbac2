#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "storyline/config.hpp"
#include "storyline/result.hpp"
#include "storyline/timed_text.hpp"

namespace storyline {

// ─── Alignment Formatter ────────────────────────────────────────────────────

// Repair, interpolate and paragraph-split raw forced-alignment output.
//
// An empty word list yields the single "(no narration)" paragraph spanning
// the whole clip. Fails with Status::OffsetMismatch when a word cannot be
// found again in its cleaned paragraph text.
Result<FormattedAlignment>
format_alignment(const AlignmentInput &input, int duration_ms,
                 const AlignmentConfig &config = AlignmentConfig{});

// ─── Individual Passes ──────────────────────────────────────────────────────

// Convert aligner words into unformatted TimedText (transcript offsets).
std::vector<TimedText> to_timed_words(const std::vector<RawWord> &words);

// Fix inverted, overlapping and out-of-range times on aligned words.
void repair_alignment_bugs(std::vector<TimedText> &words, int duration_ms);

// Fill in times for unaligned runs. A trailing run longer than
// max_trailing is erased and the transcript truncated where it began.
void interpolate_unaligned_words(std::vector<TimedText> &words,
                                 std::string &transcript, int duration_ms,
                                 int max_trailing);

// Spread [start_ms, end_ms) evenly over the given words.
void interpolate_range(const std::vector<TimedText *> &words, int start_ms,
                       int end_ms, WordCase word_case);

// Drop [...] and (...) spans, collapse whitespace, remove space before
// terminal punctuation.
std::string clean_paragraph_text(std::string_view text);

} // namespace storyline
