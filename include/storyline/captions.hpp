#pragma once

#include <array>
#include <string>
#include <vector>

#include "storyline/config.hpp"
#include "storyline/result.hpp"
#include "storyline/timed_text.hpp"

namespace storyline {

// ─── Caption Types ──────────────────────────────────────────────────────────

// One speaker's line within a cue.
struct CueText {
    std::string speaker; // "S1", "S2", or empty for no narration
    std::vector<TimedText> words;

    int time_start() const { return words.empty() ? 0 : words.front().time_start; }
    int time_end() const { return words.empty() ? 0 : words.back().time_end; }
    int duration() const { return time_end() - time_start(); }

    // Characters spanned by the words, trailing space included.
    int length() const;

    std::string text() const;
};

struct CaptionCue {
    std::vector<CueText> lines;

    int time_start() const; // earliest word start over all lines
    int time_end() const;   // latest word end over all lines
    int duration() const { return time_end() - time_start(); }

    // Range of the cue in the unformatted transcript.
    int transcript_start() const;
    int transcript_end() const;

    int line_count() const { return static_cast<int>(lines.size()); }
};

struct ValidationReport {
    int too_short = 0;
    int too_long = 0;
    int too_few_lines = 0;
    int too_many_lines = 0;
    int empty_text = 0;
    int line_too_long = 0;

    int total() const {
        return too_short + too_long + too_few_lines + too_many_lines +
               empty_text + line_too_long;
    }
};

using SpeakerOrder = std::array<std::string, 2>;

struct TextCaptions {
    std::vector<CaptionCue> cues;
    SpeakerOrder speakers;
    ValidationReport report;
};

// ─── Captioner ──────────────────────────────────────────────────────────────

// Format the raw alignment and caption it. Only formatter failures
// propagate; caption problems are logged and counted in the report.
Result<TextCaptions> caption_text(const AlignmentInput &input, int duration_ms,
                                  const CaptionConfig &config = CaptionConfig{});

// Caption already formatted paragraphs.
TextCaptions caption_paragraphs(const FormattedAlignment &alignment,
                                const CaptionConfig &config = CaptionConfig{});

// Decide whether the interviewer (S1) or the subject (S2) speaks first,
// from the even/odd paragraph character counts.
SpeakerOrder determine_speaker_order(const std::vector<AlignedParagraph> &paragraphs,
                                     double speaker1_to_speaker2_char_ratio);

// Pass 1: one cue per line, long paragraphs split greedily.
std::vector<CaptionCue> generate_cues(const FormattedAlignment &alignment,
                                      const SpeakerOrder &speakers,
                                      const CaptionConfig &config);

// Pass 2: fold short cues into an eligible neighbor.
void coalesce_cues(std::vector<CaptionCue> &cues, const CaptionConfig &config);

// Append source's lines to target, then join same-speaker neighbors.
void combine_cues(CaptionCue &target, const CaptionCue &source);

// Pass 3: count and log bound violations; never modifies cues.
ValidationReport validate_cues(const std::vector<CaptionCue> &cues,
                               const CaptionConfig &config);

// ─── Export ─────────────────────────────────────────────────────────────────

struct SyncPoint {
    int offset;  // transcript character offset
    int time_ms;

    bool operator==(const SyncPoint &) const = default;
};

// WebVTT document with <v SPEAKER> voice spans.
std::string to_vtt(const TextCaptions &captions);

// Transcript/time sync pairs: (0,0), each cue start, then the end point.
std::vector<SyncPoint> to_tsync(const TextCaptions &captions, int end_offset,
                                int end_time_ms);

// Human-readable dump for diagnostics.
std::string to_plain_text(const TextCaptions &captions);

// mm:ss.fff
std::string format_cue_time(int ms);

} // namespace storyline
